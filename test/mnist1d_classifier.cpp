#include <filesystem>
#include <iostream>
#include <memory>
#include <torch/torch.h>
#include "../include/Synapse.h"

class SignalClassifier : public Synapse::Core::Network {
public:
    SignalClassifier(int64_t features, int64_t classes)
    {
        body_ = register_module("body", torch::nn::Sequential(
            torch::nn::Linear(features, 128), torch::nn::ReLU(),
            torch::nn::Linear(128, 128), torch::nn::ReLU()));
        head_ = register_module("head", torch::nn::Linear(128, classes));
    }

    Synapse::Core::Prediction predict(const torch::Tensor& inputs) override
    {
        auto features = body_->forward(inputs);
        return {head_->forward(features), features};
    }

private:
    torch::nn::Sequential body_{nullptr};
    torch::nn::Linear head_{nullptr};
};

int main(int argc, char** argv) {
    const std::filesystem::path config_path = argc > 1 ? argv[1] : std::filesystem::path(SYNAPSE_TEST_DATA_DIR) / "config" / "mnist1d.json";
    auto config = Synapse::Common::Config::Load(config_path);
    config.training.task = Synapse::Training::Task::Classification;
    std::cout << "Cuda: " << torch::cuda::is_available() << std::endl;

    const auto raw = Synapse::Data::Generation::Signals(config.dataset);
    const auto split = Synapse::Data::Split::Build(raw, config.split.fraction, config.split.seed);
    const auto stats = Synapse::Data::Normalization::Fit(split, {.scope = Synapse::Data::Normalization::Scope::PerFeature});

    const auto train_view = Synapse::Data::View(split, Synapse::Data::Partition::Train, stats);
    const auto validation_view = Synapse::Data::View(split, Synapse::Data::Partition::Validation, stats);
    Synapse::Data::Loader train(train_view, config.loader);
    Synapse::Data::Loader validation(validation_view, {.batch_size = config.loader.batch_size});

    torch::manual_seed(config.split.seed);
    auto model = std::make_shared<SignalClassifier>(raw.features(), 10);
    auto optimizer = Synapse::Optimizer::Build(*model, Synapse::Optimizer::Adam({
        .learning_rate = config.optimization.learning_rate,
        .weight_decay = config.optimization.weight_decay}));

    Synapse::Training::MetricsLog log;
    Synapse::Training::Run(*model, *optimizer, Synapse::Loss::CrossEntropy({.label_smoothing = 0.02}),
                           train, validation, config.training, log);

    const auto& accuracy = log.at("validation_acc");
    std::cout << "Final validation accuracy: " << accuracy.back() << std::endl;

    const auto output_dir = std::filesystem::temp_directory_path() / "synapse_mnist1d_classifier";
    std::filesystem::create_directories(output_dir);
    Synapse::Common::SaveLoad::SaveMetrics(log, output_dir / "metrics.json");
    Synapse::Common::SaveLoad::SaveParameters(*model, output_dir / "parameters.binary");

    // A fresh process would warm-start like this.
    auto restored = std::make_shared<SignalClassifier>(raw.features(), 10);
    Synapse::Common::SaveLoad::LoadParameters(*restored, output_dir / "parameters.binary");
    auto restored_optimizer = Synapse::Optimizer::Build(*restored, Synapse::Optimizer::SGD({.learning_rate = 1e-3, .momentum = 0.9}));
    auto fine_tune = config.training;
    fine_tune.max_epochs = 5;
    Synapse::Training::Run(*restored, *restored_optimizer, Synapse::Loss::CrossEntropy(), train, validation, fine_tune, log);
    std::cout << "Epochs recorded: " << log.epochs() << std::endl;

    return 0;
}
