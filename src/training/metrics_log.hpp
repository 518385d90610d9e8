#ifndef SYNAPSE_TRAINING_METRICS_LOG_HPP
#define SYNAPSE_TRAINING_METRICS_LOG_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../common/errors.hpp"

namespace Synapse::Training {
    // Metric name -> one value per epoch, in the order names were first seen. Values are only
    // ever appended; nothing is truncated or reordered.
    class MetricsLog {
    public:
        using Series = std::vector<double>;
        using Entry = std::pair<std::string, double>;

        void append(std::string_view name, double value) { series_for(name).push_back(value); }

        // Registers a series without values. An existing series is left as it is.
        void declare(std::string_view name) { static_cast<void>(series_for(name)); }

        // All values of one epoch at once; either every series grows or none does.
        void append_epoch(const std::vector<Entry>& entries)
        {
            // Create missing series first; emplace_back may move the others.
            for (const auto& [name, value] : entries) {
                static_cast<void>(series_for(name));
            }
            std::vector<Series*> targets;
            targets.reserve(entries.size());
            for (const auto& [name, value] : entries) {
                targets.push_back(&series_for(name));
            }
            for (auto& series : targets) {
                series->reserve(series->size() + 1);
            }
            for (std::size_t i = 0; i < entries.size(); ++i) {
                targets[i]->push_back(entries[i].second);
            }
        }

        [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

        [[nodiscard]] const Series& at(std::string_view name) const
        {
            if (const auto* series = find(name)) {
                return *series;
            }
            throw IndexOutOfRange("No metric named '" + std::string(name) + "' in the log.");
        }

        [[nodiscard]] std::vector<std::string> names() const
        {
            std::vector<std::string> out;
            out.reserve(entries_.size());
            for (const auto& [name, series] : entries_) {
                out.push_back(name);
            }
            return out;
        }

        // Length of the longest series.
        [[nodiscard]] std::size_t epochs() const noexcept
        {
            std::size_t longest = 0;
            for (const auto& [name, series] : entries_) {
                longest = std::max(longest, series.size());
            }
            return longest;
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        [[nodiscard]] bool operator==(const MetricsLog& other) const { return entries_ == other.entries_; }
        [[nodiscard]] bool operator!=(const MetricsLog& other) const { return !(*this == other); }

    private:
        [[nodiscard]] const Series* find(std::string_view name) const noexcept
        {
            for (const auto& [key, series] : entries_) {
                if (key == name) {
                    return &series;
                }
            }
            return nullptr;
        }

        Series& series_for(std::string_view name)
        {
            for (auto& [key, series] : entries_) {
                if (key == name) {
                    return series;
                }
            }
            return entries_.emplace_back(std::string(name), Series{}).second;
        }

        std::vector<std::pair<std::string, Series>> entries_{};
    };
}

#endif // SYNAPSE_TRAINING_METRICS_LOG_HPP
