#ifndef SYNAPSE_COMMON_SAVE_LOAD_HPP
#define SYNAPSE_COMMON_SAVE_LOAD_HPP
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <torch/torch.h>

#include "../core.hpp"
#include "../training/encode.hpp"
#include "../training/metrics_log.hpp"

namespace Synapse::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw std::runtime_error(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put_value(value);
                array.push_back({"", element});
            }
            return array;
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error(std::string("Failed to read JSON from '") + path.string() + "': " + error.what());
        }
        return tree;
    }

    // {"metrics": [{"name": ..., "values": [...]}, ...]} keeps metric order and epoch order.
    inline void SaveMetrics(const Training::MetricsLog& log, const std::filesystem::path& path)
    {
        PropertyTree metrics;
        for (const auto& name : log.names()) {
            PropertyTree entry;
            entry.put("name", name);
            entry.add_child("values", Detail::write_array(log.at(name)));
            metrics.push_back({"", entry});
        }

        PropertyTree root;
        root.add_child("metrics", metrics);
        write_json_file(path, root);
    }

    [[nodiscard]] inline Training::MetricsLog LoadMetrics(const std::filesystem::path& path)
    {
        const auto root = read_json_file(path);
        const auto metrics = root.get_child_optional("metrics");
        if (!metrics) {
            throw std::runtime_error(std::string("Metrics file '") + path.string() + "' is missing the 'metrics' entry.");
        }

        Training::MetricsLog log;
        for (const auto& [key, entry] : *metrics) {
            const auto name = entry.get_optional<std::string>("name");
            if (!name) {
                throw std::runtime_error(std::string("Metric without a name in '") + path.string() + "'.");
            }
            std::vector<double> values;
            if (const auto series = entry.get_child_optional("values")) {
                values = Detail::read_array<double>(*series, "metric '" + *name + "'");
            }
            log.declare(*name);
            for (const auto value : values) {
                log.append(*name, value);
            }
        }
        return log;
    }

    inline void SaveLatents(const Training::LatentSet& latents, const std::filesystem::path& path)
    {
        torch::serialize::OutputArchive archive;
        archive.write("latents", latents.latents.detach().to(torch::kCPU));
        if (latents.labels.defined()) {
            archive.write("labels", latents.labels.detach().to(torch::kCPU));
        }
        try {
            archive.save_to(path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to write latent archive '") + path.string() + "': " + error.what());
        }
    }

    [[nodiscard]] inline Training::LatentSet LoadLatents(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error(std::string("Latent archive not found at '") + path.string() + "'.");
        }

        torch::serialize::InputArchive archive;
        Training::LatentSet latents;
        try {
            archive.load_from(path.string());
            archive.read("latents", latents.latents);
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to load latents from '") + path.string() + "': " + error.what());
        }
        torch::Tensor labels;
        if (archive.try_read("labels", labels)) {
            latents.labels = labels;
        }
        return latents;
    }

    // Parameters and buffers of a network, for warm-starting a later run.
    inline void SaveParameters(Core::Network& model, const std::filesystem::path& path)
    {
        torch::serialize::OutputArchive archive;
        model.save(archive);
        try {
            archive.save_to(path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to write parameter archive '") + path.string() + "': " + error.what());
        }
    }

    inline void LoadParameters(Core::Network& model, const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error(std::string("Parameter archive not found at '") + path.string() + "'.");
        }

        torch::serialize::InputArchive archive;
        try {
            archive.load_from(path.string());
            model.load(archive);
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to load parameters from '") + path.string() + "': " + error.what());
        }
    }
}
#endif // SYNAPSE_COMMON_SAVE_LOAD_HPP
