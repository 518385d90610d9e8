#ifndef SYNAPSE_TRAINING_ENCODE_HPP
#define SYNAPSE_TRAINING_ENCODE_HPP

#include <vector>

#include <torch/torch.h>

#include "../core.hpp"

namespace Synapse::Training {
    struct LatentSet {
        torch::Tensor latents;  // [n, L]
        torch::Tensor labels;   // [n], the batch targets in loader order
    };

    namespace Details {
        // Puts the module back into its previous train/eval mode on every exit path.
        class ModeRestore {
        public:
            explicit ModeRestore(torch::nn::Module& module) : module_(module), was_training_(module.is_training()) {}
            ~ModeRestore() { module_.train(was_training_); }

            ModeRestore(const ModeRestore&) = delete;
            ModeRestore& operator=(const ModeRestore&) = delete;

        private:
            torch::nn::Module& module_;
            bool was_training_;
        };
    }

    // Latent code of every batch with frozen parameters. The module is left in the mode it was in.
    template <class Range>
    [[nodiscard]] LatentSet Encode(Core::Network& model, Range& range, bool use_gpu = false)
    {
        const auto device = Core::DevicePolicy::select(use_gpu);
        model.to(device);

        std::vector<torch::Tensor> latents;
        std::vector<torch::Tensor> labels;
        {
            Details::ModeRestore restore(model);
            model.eval();
            torch::NoGradGuard no_grad;
            for (auto&& batch : range) {
                auto prediction = model.predict(batch.inputs.to(device));
                if (!prediction.latent || !prediction.latent->defined()) {
                    throw InvalidConfiguration("Encode needs a model whose prediction carries a latent code.");
                }
                latents.push_back(prediction.latent->detach().to(torch::kCPU));
                labels.push_back(batch.targets.detach().to(torch::kCPU));
            }
        }

        if (latents.empty()) {
            throw EmptyIterator("Encode received a range without batches.");
        }
        return LatentSet{torch::cat(latents, 0), torch::cat(labels, 0)};
    }
}

#endif // SYNAPSE_TRAINING_ENCODE_HPP
