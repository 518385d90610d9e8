#ifndef SYNAPSE_COMMON_CONFIG_HPP
#define SYNAPSE_COMMON_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <boost/property_tree/ptree.hpp>

#include "errors.hpp"
#include "save_load.hpp"
#include "../data/data.hpp"
#include "../training/loop.hpp"

namespace Synapse::Common::Config {
    struct SplitConfig {
        double fraction{0.1};
        std::uint64_t seed{42};
    };

    struct OptimizationConfig {
        double learning_rate{1e-3};
        double weight_decay{0.0};
    };

    // One experiment: generator settings, split, batching and the training schedule.
    struct ExperimentConfig {
        Data::Generation::GenerationOptions dataset{};
        SplitConfig split{};
        Data::LoaderOptions loader{};
        Training::TrainOptions training{};
        OptimizationConfig optimization{};
    };

    namespace Detail {
        using PropertyTree = SaveLoad::PropertyTree;

        // Missing key keeps `fallback`; a key that is present but does not parse is an error.
        template <class T>
        T read_or(const PropertyTree& tree, const std::string& key, T fallback)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return fallback;
            }
            const auto value = child->get_value_optional<T>();
            if (!value) {
                throw InvalidConfiguration("Config field '" + key + "' has an invalid value '" + child->data() + "'.");
            }
            return *value;
        }

        inline std::int64_t read_count(const PropertyTree& tree, const std::string& key, std::int64_t fallback, std::int64_t minimum)
        {
            const auto value = read_or<std::int64_t>(tree, key, fallback);
            if (value < minimum) {
                throw InvalidConfiguration("Config field '" + key + "' must be at least " + std::to_string(minimum)
                                           + ", got " + std::to_string(value) + '.');
            }
            return value;
        }

        inline std::uint64_t read_seed(const PropertyTree& tree, const std::string& key, std::uint64_t fallback)
        {
            return static_cast<std::uint64_t>(read_count(tree, key, static_cast<std::int64_t>(fallback), 0));
        }
    }

    [[nodiscard]] inline ExperimentConfig Parse(const SaveLoad::PropertyTree& root)
    {
        using Detail::read_count;
        using Detail::read_or;
        using Detail::read_seed;

        ExperimentConfig config;
        const SaveLoad::PropertyTree empty;

        const auto& dataset = root.get_child("dataset", empty);
        auto& generation = config.dataset;
        generation.samples = read_count(dataset, "samples", generation.samples, 1);
        generation.length = read_count(dataset, "length", generation.length, 2);
        generation.iid_noise_scale = read_or(dataset, "iid_noise_scale", generation.iid_noise_scale);
        generation.corr_noise_scale = read_or(dataset, "corr_noise_scale", generation.corr_noise_scale);
        generation.shear_scale = read_or(dataset, "shear_scale", generation.shear_scale);
        generation.scale_coeff = read_or(dataset, "scale_coeff", generation.scale_coeff);
        generation.seed = read_seed(dataset, "seed", generation.seed);
        Data::Generation::Validate(generation);

        const auto& split = root.get_child("split", empty);
        config.split.fraction = read_or(split, "fraction", config.split.fraction);
        config.split.seed = read_seed(split, "seed", config.split.seed);
        if (!(config.split.fraction > 0.0 && config.split.fraction < 1.0)) {
            throw InvalidConfiguration("Config field 'fraction' must lie strictly between 0 and 1.");
        }

        const auto& loader = root.get_child("loader", empty);
        config.loader.batch_size = read_count(loader, "batch_size", config.loader.batch_size, 1);
        config.loader.shuffle = read_or(loader, "shuffle", config.loader.shuffle);
        config.loader.drop_last = read_or(loader, "drop_last", config.loader.drop_last);
        if (loader.get_child_optional("seed")) {
            config.loader.seed = read_seed(loader, "seed", 0);
        }

        const auto& training = root.get_child("training", empty);
        auto& options = config.training;
        options.max_epochs = static_cast<std::size_t>(read_count(training, "max_epochs", static_cast<std::int64_t>(options.max_epochs), 0));
        options.log_every = static_cast<std::size_t>(read_count(training, "log_every", static_cast<std::int64_t>(options.log_every), 1));
        options.use_gpu = read_or(training, "use_gpu", options.use_gpu);
        options.color = read_or(training, "color", options.color);
        config.optimization.learning_rate = read_or(training, "learning_rate", config.optimization.learning_rate);
        config.optimization.weight_decay = read_or(training, "weight_decay", config.optimization.weight_decay);

        return config;
    }

    [[nodiscard]] inline ExperimentConfig Load(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error(std::string("Config file not found at '") + path.string() + "'.");
        }
        return Parse(SaveLoad::read_json_file(path));
    }
}

#endif // SYNAPSE_COMMON_CONFIG_HPP
