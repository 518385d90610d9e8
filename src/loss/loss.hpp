#ifndef SYNAPSE_LOSS_HPP
#define SYNAPSE_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include <torch/torch.h>

#include "details/reduction.hpp"
#include "details/ce.hpp"
#include "details/mse.hpp"

namespace Synapse::Loss {
    using Reduction = Details::Reduction;

    using Descriptor = std::variant<
        Details::MSEDescriptor,
        Details::CrossEntropyDescriptor>;


    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto CrossEntropy(const Details::CrossEntropyOptions& options = {}) noexcept -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] inline torch::Tensor Compute(const Descriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        return std::visit([&](const auto& concrete) { return Details::compute(concrete, prediction, target); }, descriptor);
    }
}

#endif //SYNAPSE_LOSS_HPP
