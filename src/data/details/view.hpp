#ifndef SYNAPSE_DATA_VIEW_HPP
#define SYNAPSE_DATA_VIEW_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "split.hpp"
#include "../transform/normalization/minmax.hpp"

namespace Synapse::Data {
    // Read-only, normalized projection of one partition. The partition is normalized once at
    // construction with the given statistics; nothing is refitted afterwards.
    class DatasetView {
    public:
        DatasetView(const SplitDataset& split, Partition partition, Normalization::NormalizationStats stats)
            : partition_(partition),
              indices_(split.indices(partition)),
              stats_(std::move(stats))
        {
            if (!split.raw.inputs.defined()) {
                throw InvalidConfiguration("Cannot build a view over an undefined split.");
            }
            if (!stats_.defined()) {
                throw InvalidConfiguration("Cannot build a view without normalization statistics.");
            }
            if (stats_.scope == Normalization::Scope::PerFeature && stats_.loc.numel() != split.raw.features()) {
                throw InvalidConfiguration("Normalization statistics cover " + std::to_string(stats_.loc.numel())
                                           + " features but the dataset has " + std::to_string(split.raw.features()) + '.');
            }

            const auto index = split.index_tensor(partition);
            inputs_ = Normalization::Apply(stats_, split.raw.inputs.index_select(0, index)).contiguous();
            if (split.raw.has_labels()) {
                labels_ = split.raw.labels->index_select(0, index).contiguous();
            }
        }

        [[nodiscard]] std::int64_t size() const noexcept { return static_cast<std::int64_t>(indices_.size()); }
        [[nodiscard]] bool empty() const noexcept { return indices_.empty(); }

        [[nodiscard]] Sample get(std::int64_t index) const
        {
            if (index < 0 || index >= size()) {
                throw IndexOutOfRange("Index " + std::to_string(index) + " is outside the "
                                      + to_string(partition_) + " view of size " + std::to_string(size()) + '.');
            }
            Sample sample{inputs_[index]};
            if (labels_) {
                sample.label = (*labels_)[index].item<std::int64_t>();
            }
            return sample;
        }

        [[nodiscard]] bool has_labels() const noexcept { return labels_.has_value(); }
        [[nodiscard]] Partition partition() const noexcept { return partition_; }
        [[nodiscard]] const std::vector<std::int64_t>& indices() const noexcept { return indices_; }
        [[nodiscard]] const Normalization::NormalizationStats& stats() const noexcept { return stats_; }

        // Whole partition as tensors: {inputs [n, D], labels [n] or undefined}.
        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> tensors() const
        {
            return {inputs_, labels_ ? *labels_ : torch::Tensor{}};
        }

    private:
        Partition partition_;
        std::vector<std::int64_t> indices_;
        Normalization::NormalizationStats stats_;
        torch::Tensor inputs_;
        std::optional<torch::Tensor> labels_{};
    };

    // Pairs two views over the same raw indices, e.g. noisy inputs with clean targets.
    class StackedView {
    public:
        StackedView(DatasetView inputs, DatasetView targets)
            : inputs_(std::move(inputs)), targets_(std::move(targets))
        {
            if (inputs_.size() != targets_.size()) {
                throw InvalidConfiguration("Stacked views differ in size: " + std::to_string(inputs_.size())
                                           + " vs " + std::to_string(targets_.size()) + '.');
            }
            if (inputs_.indices() != targets_.indices()) {
                throw InvalidConfiguration("Stacked views must cover the same raw indices; build both splits with the same seed and fraction.");
            }
        }

        [[nodiscard]] std::int64_t size() const noexcept { return inputs_.size(); }

        [[nodiscard]] std::pair<Sample, Sample> get(std::int64_t index) const
        {
            return {inputs_.get(index), targets_.get(index)};
        }

        [[nodiscard]] const DatasetView& inputs() const noexcept { return inputs_; }
        [[nodiscard]] const DatasetView& targets() const noexcept { return targets_; }

    private:
        DatasetView inputs_;
        DatasetView targets_;
    };

    [[nodiscard]] inline DatasetView View(const SplitDataset& split, Partition partition, const Normalization::NormalizationStats& stats)
    {
        return DatasetView(split, partition, stats);
    }

    [[nodiscard]] inline StackedView Stack(DatasetView inputs, DatasetView targets)
    {
        return StackedView(std::move(inputs), std::move(targets));
    }
}

#endif // SYNAPSE_DATA_VIEW_HPP
