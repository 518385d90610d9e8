#ifndef SYNAPSE_DATA_TYPES_HPP
#define SYNAPSE_DATA_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Synapse::Data {
    // Generated once, never written afterwards. Autoencoder sets may omit labels.
    struct RawSampleSet {
        torch::Tensor inputs;                      // [N, D] float32
        std::optional<torch::Tensor> labels{};     // [N] int64

        [[nodiscard]] std::int64_t size() const
        {
            return inputs.defined() && inputs.dim() > 0 ? inputs.size(0) : 0;
        }

        [[nodiscard]] std::int64_t features() const
        {
            return inputs.defined() && inputs.dim() == 2 ? inputs.size(1) : 0;
        }

        [[nodiscard]] bool has_labels() const noexcept
        {
            return labels.has_value() && labels->defined();
        }

        void Validate() const
        {
            if (!inputs.defined()) {
                throw InvalidConfiguration("Raw sample set inputs must be defined.");
            }
            if (inputs.dim() != 2) {
                throw InvalidConfiguration("Raw sample set inputs must have shape [N, D], got "
                                           + std::to_string(inputs.dim()) + " dimensions.");
            }
            if (inputs.size(0) == 0) {
                throw InvalidConfiguration("Raw sample set is empty.");
            }
            if (inputs.size(1) == 0) {
                throw InvalidConfiguration("Raw sample set vectors must not be empty.");
            }
            if (labels.has_value()) {
                if (!labels->defined() || labels->dim() != 1) {
                    throw InvalidConfiguration("Raw sample set labels must be a one-dimensional tensor.");
                }
                if (labels->size(0) != inputs.size(0)) {
                    throw InvalidConfiguration("Raw sample set holds " + std::to_string(inputs.size(0))
                                               + " inputs but " + std::to_string(labels->size(0)) + " labels.");
                }
            }
        }
    };

    struct Sample {
        torch::Tensor input;
        std::optional<std::int64_t> label{};
    };

    struct Batch {
        torch::Tensor inputs;
        torch::Tensor targets;
    };

    enum class Partition { Train, Validation };

    [[nodiscard]] inline std::string to_string(Partition partition)
    {
        return partition == Partition::Train ? "train" : "validation";
    }
}

#endif // SYNAPSE_DATA_TYPES_HPP
