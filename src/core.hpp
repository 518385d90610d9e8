#ifndef SYNAPSE_CORE_HPP
#define SYNAPSE_CORE_HPP
/*
 * Core contracts shared by the training loop and the latent tools.
 * ---------------------------------------------------------------------------
 *  - Network: the model capability the loop drives. Any torch::nn::Module that
 *    maps a batch to a Prediction can be trained, evaluated and encoded.
 *  - Prediction: the model output plus, for encoder/decoder models, the
 *    latent code produced on the way.
 *  - DevicePolicy: the single place deciding where parameters and batches live.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "common/errors.hpp"


namespace Synapse {
    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    namespace Core {
        struct Prediction {
            torch::Tensor output;
            std::optional<torch::Tensor> latent{};
        };

        class Network : public torch::nn::Module {
        public:
            using torch::nn::Module::Module;

            [[nodiscard]] virtual Prediction predict(const torch::Tensor& inputs) = 0;

            [[nodiscard]] torch::Tensor forward(const torch::Tensor& inputs) { return predict(inputs).output; }
        };

        struct DevicePolicy {
            // GPU only when asked for and present; a CPU-only machine silently stays on CPU.
            [[nodiscard]] static torch::Device select(bool use_gpu) {
                if (use_gpu && torch::cuda::is_available()) {
                    return torch::Device(torch::kCUDA, /*index=*/0);
                }
                return torch::Device(torch::kCPU);
            }
        };
    }
}

#endif // SYNAPSE_CORE_HPP
