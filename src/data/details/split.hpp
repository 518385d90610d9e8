#ifndef SYNAPSE_DATA_SPLIT_HPP
#define SYNAPSE_DATA_SPLIT_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "types.hpp"

namespace Synapse::Data {
    struct SplitDataset {
        RawSampleSet raw{};
        std::vector<std::int64_t> train_indices{};
        std::vector<std::int64_t> validation_indices{};
        double fraction{0.0};
        std::uint64_t seed{0};

        [[nodiscard]] const std::vector<std::int64_t>& indices(Partition partition) const noexcept
        {
            return partition == Partition::Train ? train_indices : validation_indices;
        }

        [[nodiscard]] torch::Tensor index_tensor(Partition partition) const
        {
            return torch::tensor(indices(partition), torch::TensorOptions().dtype(torch::kLong));
        }

        [[nodiscard]] torch::Tensor inputs(Partition partition) const
        {
            return raw.inputs.index_select(0, index_tensor(partition));
        }
    };

    namespace Split {
        namespace Detail {
            inline std::vector<std::int64_t> range_indices(std::int64_t count)
            {
                std::vector<std::int64_t> indices(static_cast<std::size_t>(count));
                std::iota(indices.begin(), indices.end(), std::int64_t{0});
                return indices;
            }

            // Fisher-Yates on the raw engine output so the permutation does not depend on the
            // standard library's distribution implementation.
            inline void shuffle(std::vector<std::int64_t>& indices, std::uint64_t seed)
            {
                std::mt19937_64 rng(seed);
                for (std::size_t i = indices.size(); i > 1; --i) {
                    const auto j = static_cast<std::size_t>(rng() % static_cast<std::uint64_t>(i));
                    std::swap(indices[i - 1], indices[j]);
                }
            }

            inline std::int64_t validation_count(std::int64_t total, double fraction)
            {
                auto count = static_cast<std::int64_t>(std::llround(static_cast<double>(total) * fraction));
                return std::clamp<std::int64_t>(count, 0, total);
            }
        }

        // Same (seed, fraction, N) always gives the same partition.
        [[nodiscard]] inline SplitDataset Build(RawSampleSet raw, double split_fraction, std::uint64_t seed)
        {
            if (!(split_fraction > 0.0 && split_fraction < 1.0)) {
                std::ostringstream message;
                message << "Split fraction must lie in (0, 1), got " << split_fraction << '.';
                throw InvalidConfiguration(message.str());
            }
            raw.Validate();

            const auto total = raw.size();
            auto permutation = Detail::range_indices(total);
            Detail::shuffle(permutation, seed);

            const auto validation_count = Detail::validation_count(total, split_fraction);
            const auto cut = permutation.begin() + validation_count;

            SplitDataset split{};
            split.validation_indices.assign(permutation.begin(), cut);
            split.train_indices.assign(cut, permutation.end());
            std::sort(split.validation_indices.begin(), split.validation_indices.end());
            std::sort(split.train_indices.begin(), split.train_indices.end());
            // Owned copy: later writes to the caller's tensors cannot reach the split.
            split.raw.inputs = raw.inputs.to(torch::kFloat32).contiguous().clone();
            if (raw.labels) {
                split.raw.labels = raw.labels->to(torch::kLong).contiguous().clone();
            }
            split.fraction = split_fraction;
            split.seed = seed;
            return split;
        }
    }
}

#endif // SYNAPSE_DATA_SPLIT_HPP
