#include <set>

#include <gtest/gtest.h>

#include "helpers.hpp"

using namespace Synapse;

TEST(Generation, ProducesRequestedShape)
{
    const auto raw = Data::Generation::Signals({.samples = 150, .length = 32});

    EXPECT_EQ(raw.inputs.sizes(), (std::vector<std::int64_t>{150, 32}));
    ASSERT_TRUE(raw.has_labels());
    EXPECT_EQ(raw.labels->size(0), 150);
    EXPECT_EQ(raw.inputs.scalar_type(), torch::kFloat32);
    EXPECT_NO_THROW(raw.Validate());
}

TEST(Generation, LabelsCoverTenClasses)
{
    const auto raw = Data::Generation::Signals({.samples = 1000});
    const auto labels = *raw.labels;

    EXPECT_GE(labels.min().item<std::int64_t>(), 0);
    EXPECT_LE(labels.max().item<std::int64_t>(), 9);
    std::set<std::int64_t> classes;
    for (std::int64_t i = 0; i < labels.size(0); ++i) {
        classes.insert(labels[i].item<std::int64_t>());
    }
    EXPECT_EQ(classes.size(), 10U);
}

TEST(Generation, SeedDeterminesOutput)
{
    const auto first = Data::Generation::Signals({.samples = 64, .seed = 9});
    const auto second = Data::Generation::Signals({.samples = 64, .seed = 9});
    const auto other = Data::Generation::Signals({.samples = 64, .seed = 10});

    EXPECT_TRUE(torch::equal(first.inputs, second.inputs));
    EXPECT_TRUE(torch::equal(*first.labels, *second.labels));
    EXPECT_FALSE(torch::equal(first.inputs, other.inputs));
}

TEST(Generation, NoiseScalesKeepUnderlyingSignal)
{
    const auto clean = Data::Generation::Signals({.samples = 64, .iid_noise_scale = 0.0, .corr_noise_scale = 0.0});
    const auto noisy = Data::Generation::Signals({.samples = 64, .iid_noise_scale = 0.1, .corr_noise_scale = 0.0});

    EXPECT_TRUE(torch::equal(*clean.labels, *noisy.labels));
    const auto difference = (noisy.inputs - clean.inputs).abs();
    EXPECT_GT(difference.max().item<double>(), 0.0);
    EXPECT_LT(difference.mean().item<double>(), 0.2);
}

TEST(Generation, RejectsBadOptions)
{
    EXPECT_THROW(static_cast<void>(Data::Generation::Signals({.samples = 0})), InvalidConfiguration);
    EXPECT_THROW(static_cast<void>(Data::Generation::Signals({.samples = 10, .length = 1})), InvalidConfiguration);
    EXPECT_THROW(static_cast<void>(Data::Generation::Signals({.samples = 10, .iid_noise_scale = -1.0})), InvalidConfiguration);
    EXPECT_THROW(static_cast<void>(Data::Generation::Signals({.samples = 10, .padding_min = 40, .padding_max = 20})),
                 InvalidConfiguration);
    EXPECT_THROW(static_cast<void>(Data::Generation::Signals({.samples = 10, .shear_scale = -0.5})), InvalidConfiguration);
    EXPECT_THROW(static_cast<void>(Data::Generation::Signals({.samples = 10, .scale_coeff = 1.0})), InvalidConfiguration);
    EXPECT_THROW(static_cast<void>(Data::Generation::Signals({.samples = 10, .scale_coeff = -0.1})), InvalidConfiguration);
    EXPECT_NO_THROW(static_cast<void>(Data::Generation::Signals({.samples = 10, .shear_scale = 0.0, .scale_coeff = 0.0})));
}
