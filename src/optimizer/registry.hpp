#ifndef SYNAPSE_OPTIMIZER_REGISTRY_HPP
#define SYNAPSE_OPTIMIZER_REGISTRY_HPP


#include <memory>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Synapse::Optimizer::Details {
    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const SGDDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::SGD>(owner.parameters(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamWDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::AdamW>(owner.parameters(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(owner.parameters(), options);
    }
}

#endif //SYNAPSE_OPTIMIZER_REGISTRY_HPP
