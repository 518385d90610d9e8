#ifndef SYNAPSE_LOSS_HELPER_HPP
#define SYNAPSE_LOSS_HELPER_HPP

#include <cmath>
#include <vector>

#include <torch/torch.h>

#include "reduction.hpp"
#include "../../common/errors.hpp"

namespace Synapse::Loss::Details {
    // Per-feature weights as a [D] tensor on the loss device. One weight per trailing feature,
    // each finite and non-negative, with at least one positive.
    inline torch::Tensor feature_weights(const std::vector<double>& weights, const torch::Tensor& per_element) {
        TORCH_CHECK(per_element.dim() >= 1 && static_cast<std::int64_t>(weights.size()) == per_element.size(-1),
                    "Loss weight holds ", weights.size(), " entries for ", per_element.size(-1), " features");

        double total = 0.0;
        for (const auto w : weights) {
            if (!std::isfinite(w) || w < 0.0) {
                throw InvalidConfiguration("Loss feature weights must be finite and non-negative.");
            }
            total += w;
        }
        if (total <= 0.0) {
            throw InvalidConfiguration("Loss feature weights must not all be zero.");
        }
        return torch::tensor(weights, torch::TensorOptions().dtype(per_element.scalar_type()).device(per_element.device()));
    }

    // Sum weights every element by its feature; Mean divides by the total weight over all rows.
    inline torch::Tensor reduce_feature_weighted(const torch::Tensor& per_element, const std::vector<double>& weights, Reduction reduction) {
        const auto weight = feature_weights(weights, per_element);
        const auto weighted = (per_element * weight).sum();
        if (reduction == Reduction::Sum) {
            return weighted;
        }
        const auto rows = per_element.numel() / per_element.size(-1);
        return weighted / (weight.sum() * static_cast<double>(rows));
    }
}
#endif //SYNAPSE_LOSS_HELPER_HPP
