#ifndef SYNAPSE_DATA_GENERATION_HPP
#define SYNAPSE_DATA_GENERATION_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "types.hpp"

namespace Synapse::Data::Generation {
    struct GenerationOptions {
        std::int64_t samples{4000};
        std::int64_t length{40};
        double iid_noise_scale{2e-2};
        double corr_noise_scale{0.25};
        double shear_scale{0.75};
        double scale_coeff{0.4};
        std::int64_t padding_min{36};
        std::int64_t padding_max{60};
        std::uint64_t seed{42};
    };

    namespace Details {
        inline constexpr std::size_t kTemplateLength = 12;
        inline constexpr std::int64_t kClasses = 10;

        // One 12-point waveform per class, baseline at 5.
        inline constexpr std::array<std::array<double, kTemplateLength>, kClasses> kTemplates{{
            {5.0, 6.0, 6.5, 6.75, 7.0, 7.0, 7.0, 7.0, 6.75, 6.5, 6.0, 5.0},
            {5.0, 3.0, 3.0, 3.4, 3.8, 4.2, 4.6, 5.0, 5.4, 5.8, 5.0, 5.0},
            {5.0, 6.0, 6.5, 6.5, 6.0, 5.25, 4.75, 4.0, 3.5, 3.5, 4.0, 5.0},
            {5.0, 6.0, 6.5, 6.5, 6.0, 5.0, 5.0, 6.0, 6.5, 6.5, 6.0, 5.0},
            {5.0, 4.4, 3.8, 3.2, 2.6, 2.6, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0},
            {5.0, 3.0, 3.0, 3.0, 3.0, 5.0, 6.0, 6.5, 6.5, 6.0, 4.5, 5.0},
            {5.0, 4.0, 3.5, 3.25, 3.0, 3.0, 3.0, 3.0, 3.25, 3.5, 4.0, 5.0},
            {5.0, 7.0, 7.0, 6.6, 6.2, 5.8, 5.4, 5.0, 4.6, 4.2, 5.0, 5.0},
            {5.0, 4.0, 3.5, 3.5, 4.0, 5.0, 5.0, 4.0, 3.5, 3.5, 4.0, 5.0},
            {5.0, 4.0, 3.5, 3.5, 4.0, 5.0, 5.0, 5.0, 5.0, 4.7, 4.3, 5.0},
        }};

        inline double uniform(std::mt19937_64& engine, double low, double high)
        {
            std::uniform_real_distribution<double> distribution(low, high);
            return distribution(engine);
        }

        inline std::vector<double> pad(const std::array<double, kTemplateLength>& waveform, std::int64_t total, std::int64_t offset)
        {
            std::vector<double> padded(static_cast<std::size_t>(total), 0.0);
            for (std::size_t i = 0; i < waveform.size(); ++i) {
                padded[static_cast<std::size_t>(offset) + i] = waveform[i] - 5.0;
            }
            return padded;
        }

        // Linear interpolation of a circular signal at fractional position.
        inline double sample_circular(const std::vector<double>& signal, double position)
        {
            const auto n = static_cast<double>(signal.size());
            position = std::fmod(position, n);
            if (position < 0.0) {
                position += n;
            }
            const auto left = static_cast<std::size_t>(std::floor(position));
            const auto right = (left + 1) % signal.size();
            const auto weight = position - std::floor(position);
            return (1.0 - weight) * signal[left] + weight * signal[right];
        }
    }

    inline void Validate(const GenerationOptions& options)
    {
        if (options.samples <= 0) {
            throw InvalidConfiguration("Signal generation needs a positive sample count.");
        }
        if (options.length < 2) {
            throw InvalidConfiguration("Signal length must be at least 2.");
        }
        if (options.padding_min < static_cast<std::int64_t>(Details::kTemplateLength) || options.padding_max < options.padding_min) {
            throw InvalidConfiguration("Padding range must satisfy " + std::to_string(Details::kTemplateLength)
                                       + " <= padding_min <= padding_max.");
        }
        if (options.iid_noise_scale < 0.0 || options.corr_noise_scale < 0.0) {
            throw InvalidConfiguration("Noise scales must be non-negative.");
        }
        if (!(options.shear_scale >= 0.0)) {
            throw InvalidConfiguration("Shear scale must be non-negative.");
        }
        if (!(options.scale_coeff >= 0.0 && options.scale_coeff < 1.0)) {
            throw InvalidConfiguration("Scale coefficient must lie in [0, 1).");
        }
    }

    // Labelled 1-D signals. Structure (label, offset, shift, stretch, shear) and noise come from
    // separate engines, so changing only the noise scales keeps labels and clean shapes identical.
    [[nodiscard]] inline RawSampleSet Signals(const GenerationOptions& options = {})
    {
        Validate(options);

        std::mt19937_64 structure(options.seed);
        std::mt19937_64 noise(options.seed ^ 0x9E3779B97F4A7C15ULL);
        std::normal_distribution<double> gaussian(0.0, 1.0);

        const auto n = options.samples;
        const auto length = options.length;
        auto inputs = torch::empty({n, length}, torch::TensorOptions().dtype(torch::kFloat32));
        auto labels = torch::empty({n}, torch::TensorOptions().dtype(torch::kLong));
        auto input_accessor = inputs.accessor<float, 2>();
        auto label_accessor = labels.accessor<std::int64_t, 1>();

        std::vector<double> corr(static_cast<std::size_t>(length));
        for (std::int64_t row = 0; row < n; ++row) {
            const auto label = static_cast<std::int64_t>(structure() % static_cast<std::uint64_t>(Details::kClasses));
            const auto span = options.padding_max - options.padding_min + 1;
            const auto total = options.padding_min + static_cast<std::int64_t>(structure() % static_cast<std::uint64_t>(span));
            const auto offset = static_cast<std::int64_t>(
                structure() % static_cast<std::uint64_t>(total - static_cast<std::int64_t>(Details::kTemplateLength) + 1));
            const auto shift = Details::uniform(structure, 0.0, static_cast<double>(total));
            const auto stretch = Details::uniform(structure, 1.0 - options.scale_coeff, 1.0 + options.scale_coeff);
            const auto shear = Details::uniform(structure, -options.shear_scale, options.shear_scale);

            const auto padded = Details::pad(Details::kTemplates[static_cast<std::size_t>(label)], total, offset);

            // Correlated noise: running mean of white noise over a short window.
            double running = 0.0;
            for (std::int64_t t = 0; t < length; ++t) {
                running = 0.7 * running + 0.3 * gaussian(noise);
                corr[static_cast<std::size_t>(t)] = running;
            }

            for (std::int64_t t = 0; t < length; ++t) {
                const auto unit = static_cast<double>(t) / static_cast<double>(length - 1);
                const auto position = shift + (unit - 0.5) * static_cast<double>(total) / stretch + static_cast<double>(total) / 2.0;
                auto value = Details::sample_circular(padded, position);
                value += shear * (2.0 * unit - 1.0);
                value += options.corr_noise_scale * corr[static_cast<std::size_t>(t)];
                value += options.iid_noise_scale * gaussian(noise);
                input_accessor[row][t] = static_cast<float>(value);
            }
            label_accessor[row] = label;
        }

        return RawSampleSet{inputs, labels};
    }
}

#endif // SYNAPSE_DATA_GENERATION_HPP
