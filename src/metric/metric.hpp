#ifndef SYNAPSE_METRIC_HPP
#define SYNAPSE_METRIC_HPP

#include <cstdint>

#include <torch/torch.h>

namespace Synapse::Metric::Classification {
    // Fraction of rows whose arg-max over the last dimension equals the target label.
    // Targets may be class indices [B] or one-hot / probability rows [B, C].
    [[nodiscard]] inline double Accuracy(const torch::Tensor& logits, const torch::Tensor& targets)
    {
        TORCH_CHECK(logits.dim() >= 1 && logits.size(0) > 0, "Accuracy needs a non-empty batch of logits");

        auto predicted = logits.detach().argmax(-1).to(torch::kCPU, torch::kLong);
        auto labels = targets.detach().to(torch::kCPU);
        if (labels.is_floating_point() && labels.dim() == logits.dim()) {
            labels = labels.argmax(-1);
        }
        labels = labels.to(torch::kLong).reshape(predicted.sizes());

        const auto correct = predicted.eq(labels).sum().item<std::int64_t>();
        return static_cast<double>(correct) / static_cast<double>(predicted.numel());
    }
}

#endif // SYNAPSE_METRIC_HPP
