#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "helpers.hpp"

using namespace Synapse;

namespace {
    struct Pipeline {
        Data::SplitDataset split;
        Data::DatasetView train;
        Data::DatasetView validation;

        explicit Pipeline(std::int64_t samples = 240)
            : split(Data::Split::Build(Test::SmallSignals(samples), 0.25, 42)),
              train(Data::View(split, Data::Partition::Train, Data::Normalization::Fit(split))),
              validation(Data::View(split, Data::Partition::Validation, train.stats()))
        {}
    };

    Training::TrainOptions Quiet(std::size_t epochs, Training::Task task = Training::Task::Reconstruction)
    {
        return {.max_epochs = epochs, .task = task, .stream = nullptr};
    }

    Training::MetricsLog TrainAutoencoder(const Pipeline& pipeline, std::size_t epochs)
    {
        auto model = Test::MakeAutoencoder(pipeline.train.tensors().first.size(1));
        auto optimizer = Optimizer::Build(*model, Optimizer::Adam({.learning_rate = 1e-2}));
        Data::Loader train(pipeline.train, {.batch_size = 32, .shuffle = true, .seed = 1}, Data::TargetKind::Inputs);
        Data::Loader validation(pipeline.validation, {.batch_size = 32}, Data::TargetKind::Inputs);

        Training::MetricsLog log;
        Training::Run(*model, *optimizer, Loss::MSE(), train, validation, Quiet(epochs), log);
        return log;
    }
}

TEST(Loop, ZeroEpochsLeavesEverythingUntouched)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::SGD({.learning_rate = 0.1}));
    Data::Loader train(pipeline.train, {.batch_size = 16}, Data::TargetKind::Inputs);
    Data::Loader validation(pipeline.validation, {.batch_size = 16}, Data::TargetKind::Inputs);

    std::vector<torch::Tensor> before;
    for (const auto& parameter : model->parameters()) {
        before.push_back(parameter.detach().clone());
    }

    Training::MetricsLog log;
    log.append("train_loss", 0.5);
    auto& returned = Training::Run(*model, *optimizer, Loss::MSE(), train, validation, Quiet(0), log);

    EXPECT_EQ(&returned, &log);
    EXPECT_EQ(log.size(), 1U);
    EXPECT_EQ(log.at("train_loss").size(), 1U);

    const auto after = model->parameters();
    for (std::size_t i = 0; i < before.size(); ++i) {
        EXPECT_TRUE(torch::equal(before[i], after[i]));
    }
}

TEST(Loop, ReconstructionRecordsLossesInOrder)
{
    Pipeline pipeline;
    const auto log = TrainAutoencoder(pipeline, 3);

    const auto names = log.names();
    ASSERT_EQ(names.size(), 2U);
    EXPECT_EQ(names[0], "train_loss");
    EXPECT_EQ(names[1], "validation_loss");
    EXPECT_EQ(log.at("train_loss").size(), 3U);
    EXPECT_EQ(log.at("validation_loss").size(), 3U);
    EXPECT_FALSE(log.contains("train_acc"));
}

TEST(Loop, TrainingReducesReconstructionLoss)
{
    Pipeline pipeline(400);
    const auto log = TrainAutoencoder(pipeline, 15);

    const auto& train = log.at("train_loss");
    EXPECT_LT(train.back(), train.front());
}

TEST(Loop, ContinuedRunsAppend)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::AdamW());
    Data::Loader train(pipeline.train, {.batch_size = 32}, Data::TargetKind::Inputs);
    Data::Loader validation(pipeline.validation, {.batch_size = 32}, Data::TargetKind::Inputs);

    Training::MetricsLog log;
    Training::Run(*model, *optimizer, Loss::MSE(), train, validation, Quiet(5), log);
    const auto first_five = log.at("train_loss");
    Training::Run(*model, *optimizer, Loss::MSE(), train, validation, Quiet(5), log);

    ASSERT_EQ(log.at("train_loss").size(), 10U);
    ASSERT_EQ(log.at("validation_loss").size(), 10U);
    for (std::size_t i = 0; i < first_five.size(); ++i) {
        EXPECT_EQ(log.at("train_loss")[i], first_five[i]);
    }
}

TEST(Loop, SeededRerunsAreBitIdentical)
{
    Pipeline pipeline;
    const auto first = TrainAutoencoder(pipeline, 4);
    const auto second = TrainAutoencoder(pipeline, 4);

    EXPECT_TRUE(first == second);
}

TEST(Loop, ClassificationAddsAccuracy)
{
    Pipeline pipeline(400);
    auto model = Test::MakeClassifier(40, 10);
    auto optimizer = Optimizer::Build(*model, Optimizer::Adam({.learning_rate = 5e-3}));
    Data::Loader train(pipeline.train, {.batch_size = 32, .shuffle = true, .seed = 3});
    Data::Loader validation(pipeline.validation, {.batch_size = 64});

    Training::MetricsLog log;
    Training::Run(*model, *optimizer, Loss::CrossEntropy(), train, validation,
                  Quiet(6, Training::Task::Classification), log);

    const auto names = log.names();
    ASSERT_EQ(names.size(), 4U);
    EXPECT_EQ(names[2], "train_acc");
    EXPECT_EQ(names[3], "validation_acc");
    for (const auto& name : names) {
        EXPECT_EQ(log.at(name).size(), 6U);
    }
    for (const auto value : log.at("validation_acc")) {
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 1.0);
    }
    EXPECT_GT(log.at("train_acc").back(), 0.1);
}

TEST(Loop, EmptyTrainingRangeThrows)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::SGD());
    std::vector<Data::Batch> empty;
    Data::Loader validation(pipeline.validation, {.batch_size = 16}, Data::TargetKind::Inputs);

    Training::MetricsLog log;
    EXPECT_THROW(Training::Run(*model, *optimizer, Loss::MSE(), empty, validation, Quiet(2), log), EmptyIterator);
    EXPECT_TRUE(log.empty());
}

TEST(Loop, EmptyEvaluationRangeThrowsWithoutPartialEpoch)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::SGD());
    Data::Loader train(pipeline.train, {.batch_size = 16}, Data::TargetKind::Inputs);
    std::vector<Data::Batch> empty;

    Training::MetricsLog log;
    EXPECT_THROW(Training::Run(*model, *optimizer, Loss::MSE(), train, empty, Quiet(2), log), EmptyIterator);
    EXPECT_FALSE(log.contains("train_loss"));
}

TEST(Loop, ZeroLogIntervalIsRejected)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::SGD());
    Data::Loader train(pipeline.train, {.batch_size = 16}, Data::TargetKind::Inputs);

    auto options = Quiet(1);
    options.log_every = 0;
    Training::MetricsLog log;
    EXPECT_THROW(Training::Run(*model, *optimizer, Loss::MSE(), train, train, options, log), InvalidConfiguration);
}

TEST(Loop, ZeroEpochsIgnoresLogInterval)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::SGD());
    Data::Loader train(pipeline.train, {.batch_size = 16}, Data::TargetKind::Inputs);

    auto options = Quiet(0);
    options.log_every = 0;
    Training::MetricsLog log;
    EXPECT_NO_THROW(Training::Run(*model, *optimizer, Loss::MSE(), train, train, options, log));
    EXPECT_TRUE(log.empty());
}

TEST(Loop, ShapeMismatchPropagatesFromLoss)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::SGD());
    Data::Loader train(pipeline.train, {.batch_size = 16});  // label targets against a reconstruction loss
    Data::Loader validation(pipeline.validation, {.batch_size = 16});

    Training::MetricsLog log;
    EXPECT_THROW(Training::Run(*model, *optimizer, Loss::MSE(), train, validation, Quiet(1), log), ShapeMismatch);
    EXPECT_TRUE(log.empty());
}

TEST(Loop, ProgressLinesFollowLogInterval)
{
    Pipeline pipeline;
    auto model = Test::MakeAutoencoder(40);
    auto optimizer = Optimizer::Build(*model, Optimizer::SGD());
    Data::Loader train(pipeline.train, {.batch_size = 64}, Data::TargetKind::Inputs);
    Data::Loader validation(pipeline.validation, {.batch_size = 64}, Data::TargetKind::Inputs);

    std::ostringstream stream;
    Training::TrainOptions options{.max_epochs = 7, .log_every = 3, .stream = &stream, .color = false};
    Training::MetricsLog log;
    Training::Run(*model, *optimizer, Loss::MSE(), train, validation, options, log);

    std::vector<std::string> lines;
    std::istringstream reader(stream.str());
    for (std::string line; std::getline(reader, line);) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0].rfind("Epoch [3/7] | Train loss: ", 0), 0U);
    EXPECT_EQ(lines[1].rfind("Epoch [6/7]", 0), 0U);
    EXPECT_EQ(lines[2].rfind("Epoch [7/7]", 0), 0U);
    EXPECT_NE(lines[2].find("Validation loss: "), std::string::npos);
    EXPECT_NE(lines[2].find("duration: "), std::string::npos);
}
