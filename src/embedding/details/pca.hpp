#ifndef SYNAPSE_EMBEDDING_PCA_HPP
#define SYNAPSE_EMBEDDING_PCA_HPP

#include <algorithm>
#include <cstdint>
#include <tuple>

#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Synapse::Embedding {
    struct PCAResult {
        torch::Tensor components;          // [k, L]
        torch::Tensor explained_variance;  // [k]
        torch::Tensor singular_values;     // [k]
        torch::Tensor mean;                // [L]
        torch::Tensor transformed;         // [n, k]
    };

    // Principal axes of a latent matrix (observations x features) through a thin SVD.
    [[nodiscard]] inline PCAResult PCA(const torch::Tensor& latents, std::int64_t components = 2, bool whiten = false)
    {
        if (!latents.defined() || latents.dim() != 2) {
            throw InvalidConfiguration("PCA expects a two-dimensional tensor (observations x features).");
        }
        if (latents.size(0) < 2) {
            throw InvalidConfiguration("PCA needs at least two observations.");
        }

        auto data = latents.detach().to(torch::kCPU, torch::kFloat32).contiguous();
        const auto samples = data.size(0);
        const auto features = data.size(1);
        const auto rank = std::min(samples, features);
        if (components <= 0 || components > rank) {
            components = rank;
        }

        auto mean = data.mean(0);
        data = data - mean;

        auto [U, S, Vh] = torch::linalg_svd(data, /*full_matrices=*/false);

        auto selected_singular = S.narrow(0, 0, components);
        auto components_matrix = Vh.narrow(0, 0, components);
        auto explained_variance = selected_singular.pow(2) / static_cast<double>(samples - 1);
        auto transformed = U.narrow(1, 0, components) * selected_singular;

        if (whiten) {
            transformed = transformed * torch::reciprocal(torch::sqrt(explained_variance + 1e-12));
        }

        return {components_matrix, explained_variance, selected_singular, mean, transformed};
    }

    [[nodiscard]] inline torch::Tensor ProjectPCA(const torch::Tensor& latents, const PCAResult& pca)
    {
        auto data = latents.detach().to(torch::kCPU, torch::kFloat32);
        if (data.dim() != 2 || data.size(1) != pca.mean.numel()) {
            throw InvalidConfiguration("Latents do not match the feature count the PCA was fitted on.");
        }
        return torch::matmul(data - pca.mean, pca.components.transpose(0, 1));
    }
}

#endif // SYNAPSE_EMBEDDING_PCA_HPP
