#ifndef SYNAPSE_TEST_HELPERS_HPP
#define SYNAPSE_TEST_HELPERS_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <torch/torch.h>

#include "../include/Synapse.h"

namespace Synapse::Test {
    class TinyAutoencoder : public Core::Network {
    public:
        TinyAutoencoder(std::int64_t features, std::int64_t hidden, std::int64_t latent)
        {
            encoder_in_ = register_module("encoder_in", torch::nn::Linear(features, hidden));
            encoder_out_ = register_module("encoder_out", torch::nn::Linear(hidden, latent));
            decoder_in_ = register_module("decoder_in", torch::nn::Linear(latent, hidden));
            decoder_out_ = register_module("decoder_out", torch::nn::Linear(hidden, features));
        }

        Core::Prediction predict(const torch::Tensor& inputs) override
        {
            auto latent = encoder_out_->forward(torch::relu(encoder_in_->forward(inputs)));
            auto output = decoder_out_->forward(torch::relu(decoder_in_->forward(latent)));
            return {output, latent};
        }

    private:
        torch::nn::Linear encoder_in_{nullptr};
        torch::nn::Linear encoder_out_{nullptr};
        torch::nn::Linear decoder_in_{nullptr};
        torch::nn::Linear decoder_out_{nullptr};
    };

    class TinyClassifier : public Core::Network {
    public:
        TinyClassifier(std::int64_t features, std::int64_t hidden, std::int64_t classes)
        {
            hidden_ = register_module("hidden", torch::nn::Linear(features, hidden));
            head_ = register_module("head", torch::nn::Linear(hidden, classes));
        }

        Core::Prediction predict(const torch::Tensor& inputs) override
        {
            auto features = torch::relu(hidden_->forward(inputs));
            return {head_->forward(features), features};
        }

    private:
        torch::nn::Linear hidden_{nullptr};
        torch::nn::Linear head_{nullptr};
    };

    // Output only, no latent code.
    class PlainRegressor : public Core::Network {
    public:
        explicit PlainRegressor(std::int64_t features)
        {
            linear_ = register_module("linear", torch::nn::Linear(features, features));
        }

        Core::Prediction predict(const torch::Tensor& inputs) override { return {linear_->forward(inputs)}; }

    private:
        torch::nn::Linear linear_{nullptr};
    };

    inline std::shared_ptr<TinyAutoencoder> MakeAutoencoder(std::int64_t features, std::uint64_t seed = 7)
    {
        torch::manual_seed(seed);
        return std::make_shared<TinyAutoencoder>(features, 16, 4);
    }

    inline std::shared_ptr<TinyClassifier> MakeClassifier(std::int64_t features, std::int64_t classes, std::uint64_t seed = 7)
    {
        torch::manual_seed(seed);
        return std::make_shared<TinyClassifier>(features, 32, classes);
    }

    inline Data::RawSampleSet SmallSignals(std::int64_t samples = 200, std::uint64_t seed = 42)
    {
        return Data::Generation::Signals({.samples = samples, .seed = seed});
    }

    // Removes its directory when the test ends.
    class TemporaryDirectory {
    public:
        explicit TemporaryDirectory(const std::string& name)
            : path_(std::filesystem::temp_directory_path() / ("synapse_" + name))
        {
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }

        ~TemporaryDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] std::filesystem::path file(const std::string& name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };
}

#endif // SYNAPSE_TEST_HELPERS_HPP
