#ifndef SYNAPSE_CE_HPP
#define SYNAPSE_CE_HPP
#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Synapse::Loss::Details {
    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double label_smoothing{0.0};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    // prediction: logits [B, C]; target: class indices [B].
    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target) {
        auto opts = torch::nn::functional::CrossEntropyFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::CrossEntropyFuncOptions>(descriptor.options.reduction));
        opts = opts.label_smoothing(descriptor.options.label_smoothing);
        if (!descriptor.options.weight.empty()) {
            auto weight_tensor = torch::tensor(
                descriptor.options.weight,
                torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device()));
            opts = opts.weight(weight_tensor);
        }
        return torch::nn::functional::cross_entropy(prediction, target.to(prediction.device(), torch::kLong), opts);
    }
}
#endif //SYNAPSE_CE_HPP
