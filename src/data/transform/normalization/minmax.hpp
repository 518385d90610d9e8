#ifndef SYNAPSE_DATA_TRANSFORM_NORMALIZATION_MINMAX_HPP
#define SYNAPSE_DATA_TRANSFORM_NORMALIZATION_MINMAX_HPP

#include <cstdint>
#include <sstream>
#include <string>

#include <torch/torch.h>

#include "../../details/split.hpp"

namespace Synapse::Data::Normalization {
    enum class Scope {
        Global,     // one (loc, scale) pair over every training value
        PerFeature  // one pair per input position
    };

    enum class DegeneratePolicy {
        Throw,
        UnitScale   // zero spread is replaced by 1
    };

    namespace Options {
        struct MinMaxOptions {
            Scope scope{Scope::Global};
            DegeneratePolicy on_degenerate{DegeneratePolicy::Throw};
        };
    }

    using NormalizationOptions = Options::MinMaxOptions;

    // Frozen once fitted: loc and scale are private copies and never written again.
    struct NormalizationStats {
        torch::Tensor loc;
        torch::Tensor scale;
        Scope scope{Scope::Global};

        [[nodiscard]] bool defined() const noexcept { return loc.defined() && scale.defined(); }

        [[nodiscard]] double loc_value() const { return loc.item<double>(); }
        [[nodiscard]] double scale_value() const { return scale.item<double>(); }
    };

    namespace Details {
        inline void check_compatible(const NormalizationStats& stats, const torch::Tensor& x)
        {
            if (!stats.defined()) {
                throw InvalidConfiguration("Normalization statistics are undefined.");
            }
            if (stats.scope == Scope::PerFeature
                && (x.dim() == 0 || x.size(-1) != stats.loc.numel())) {
                std::ostringstream message;
                message << "Per-feature statistics cover " << stats.loc.numel()
                        << " features but the tensor's last dimension is "
                        << (x.dim() == 0 ? 0 : x.size(-1)) << '.';
                throw InvalidConfiguration(message.str());
            }
        }
    }

    [[nodiscard]] inline NormalizationStats Fit(const SplitDataset& split, const Options::MinMaxOptions& options = {})
    {
        if (split.train_indices.empty()) {
            throw InvalidConfiguration("Cannot fit normalization statistics on an empty training partition.");
        }

        const auto train = split.inputs(Partition::Train).to(torch::kFloat32);

        torch::Tensor low;
        torch::Tensor high;
        if (options.scope == Scope::PerFeature) {
            low = std::get<0>(train.min(0));
            high = std::get<0>(train.max(0));
        } else {
            low = train.min();
            high = train.max();
        }

        auto scale = high - low;
        const auto degenerate = scale.eq(0);
        if (degenerate.any().item<bool>()) {
            if (options.on_degenerate == DegeneratePolicy::Throw) {
                std::ostringstream message;
                message << "Training inputs have zero spread (min == max";
                if (options.scope == Scope::PerFeature) {
                    message << " for " << degenerate.sum().item<std::int64_t>() << " feature(s)";
                }
                message << "); cannot derive a normalization scale.";
                throw DegenerateData(message.str());
            }
            scale = torch::where(degenerate, torch::ones_like(scale), scale);
        }

        return NormalizationStats{low.clone(), scale.clone(), options.scope};
    }

    [[nodiscard]] inline torch::Tensor Apply(const NormalizationStats& stats, const torch::Tensor& x)
    {
        Details::check_compatible(stats, x);
        auto values = x.to(torch::kFloat32);
        return (values - stats.loc.to(values.device())) / stats.scale.to(values.device());
    }

    [[nodiscard]] inline torch::Tensor Invert(const NormalizationStats& stats, const torch::Tensor& y)
    {
        Details::check_compatible(stats, y);
        auto values = y.to(torch::kFloat32);
        return values * stats.scale.to(values.device()) + stats.loc.to(values.device());
    }
}

#endif // SYNAPSE_DATA_TRANSFORM_NORMALIZATION_MINMAX_HPP
