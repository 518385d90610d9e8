#ifndef SYNAPSE_MSE_HPP
#define SYNAPSE_MSE_HPP

#include <optional>
#include <vector>
#include <torch/torch.h>
#include "helper.hpp"

namespace Synapse::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{}; // per-feature weights, broadcast over the batch
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };


    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        // Reconstruction targets must match element for element; no silent broadcasting.
        TORCH_CHECK(prediction.sizes() == target.sizes(),
                    "MSE expects prediction and target of equal shape, got ", prediction.sizes(),
                    " and ", target.sizes());

        const auto reference = target.to(prediction.device(), prediction.scalar_type());
        if (descriptor.options.weight.empty()) {
            return F::mse_loss(
                prediction,
                reference,
                F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction))
            );
        }

        auto per_elem = F::mse_loss(prediction, reference, F::MSELossFuncOptions().reduction(torch::kNone));
        return reduce_feature_weighted(per_elem, descriptor.options.weight, descriptor.options.reduction);
    }

}

#endif // SYNAPSE_MSE_HPP
