#ifndef SYNAPSE_DATA_LOADER_HPP
#define SYNAPSE_DATA_LOADER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "view.hpp"

namespace Synapse::Data {
    enum class TargetKind {
        Labels,  // classification
        Inputs   // reconstruction of the input itself
    };

    struct LoaderOptions {
        std::int64_t batch_size{64};
        bool shuffle{false};
        std::optional<std::uint64_t> seed{};
        bool drop_last{false};
    };

    // Fixed-size batches over a view. With shuffle on, every begin() draws a new order from the
    // loader's own engine, so a seeded loader replays the same sequence of epochs.
    class Loader {
    public:
        class Iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Batch;
            using difference_type = std::ptrdiff_t;
            using pointer = const Batch*;
            using reference = Batch;

            Iterator() = default;
            Iterator(const Loader* loader, torch::Tensor order, std::int64_t batch)
                : loader_(loader), order_(std::move(order)), batch_(batch) {}

            [[nodiscard]] Batch operator*() const { return loader_->fetch(order_, batch_); }

            Iterator& operator++()
            {
                ++batch_;
                return *this;
            }

            Iterator operator++(int)
            {
                auto previous = *this;
                ++batch_;
                return previous;
            }

            [[nodiscard]] bool operator==(const Iterator& other) const noexcept { return batch_ == other.batch_; }
            [[nodiscard]] bool operator!=(const Iterator& other) const noexcept { return batch_ != other.batch_; }

        private:
            const Loader* loader_{nullptr};
            torch::Tensor order_{};
            std::int64_t batch_{0};
        };

        Loader(const DatasetView& view, LoaderOptions options = {}, TargetKind targets = TargetKind::Labels)
            : options_(std::move(options))
        {
            validate_options();
            auto [inputs, labels] = view.tensors();
            inputs_ = inputs;
            if (targets == TargetKind::Labels) {
                if (!labels.defined()) {
                    throw InvalidConfiguration("Label targets requested for a " + to_string(view.partition())
                                               + " view without labels.");
                }
                targets_ = labels;
            } else {
                targets_ = inputs;
            }
            reset_engine();
        }

        Loader(const StackedView& view, LoaderOptions options = {})
            : options_(std::move(options))
        {
            validate_options();
            inputs_ = view.inputs().tensors().first;
            targets_ = view.targets().tensors().first;
            reset_engine();
        }

        [[nodiscard]] Iterator begin()
        {
            torch::Tensor order;
            if (options_.shuffle && samples() > 1) {
                std::vector<std::int64_t> permutation(static_cast<std::size_t>(samples()));
                for (std::size_t i = 0; i < permutation.size(); ++i) {
                    permutation[i] = static_cast<std::int64_t>(i);
                }
                for (std::size_t i = permutation.size(); i > 1; --i) {
                    const auto j = static_cast<std::size_t>(engine_() % static_cast<std::uint64_t>(i));
                    std::swap(permutation[i - 1], permutation[j]);
                }
                order = torch::tensor(permutation, torch::TensorOptions().dtype(torch::kLong));
            }
            return Iterator(this, std::move(order), 0);
        }

        [[nodiscard]] Iterator end() const { return Iterator(this, torch::Tensor{}, size()); }

        // Number of batches per epoch.
        [[nodiscard]] std::int64_t size() const noexcept
        {
            const auto total = samples();
            if (options_.drop_last) {
                return total / options_.batch_size;
            }
            return (total + options_.batch_size - 1) / options_.batch_size;
        }

        [[nodiscard]] bool empty() const noexcept { return size() == 0; }
        [[nodiscard]] std::int64_t samples() const noexcept { return inputs_.defined() ? inputs_.size(0) : 0; }
        [[nodiscard]] const LoaderOptions& options() const noexcept { return options_; }

        // Restarts the shuffle sequence from the configured seed.
        void reset_engine()
        {
            if (options_.seed) {
                engine_.seed(*options_.seed);
            } else {
                std::random_device device;
                engine_.seed(device());
            }
        }

    private:
        void validate_options() const
        {
            if (options_.batch_size <= 0) {
                throw InvalidConfiguration("Batch size must be greater than zero, got "
                                           + std::to_string(options_.batch_size) + '.');
            }
        }

        [[nodiscard]] Batch fetch(const torch::Tensor& order, std::int64_t batch) const
        {
            const auto offset = batch * options_.batch_size;
            const auto current = std::min<std::int64_t>(options_.batch_size, samples() - offset);
            if (current <= 0) {
                throw IndexOutOfRange("Batch " + std::to_string(batch) + " is past the end of the loader.");
            }

            if (order.defined()) {
                auto batch_indices = order.narrow(0, offset, current);
                return Batch{inputs_.index_select(0, batch_indices), targets_.index_select(0, batch_indices)};
            }
            return Batch{inputs_.narrow(0, offset, current), targets_.narrow(0, offset, current)};
        }

        LoaderOptions options_;
        torch::Tensor inputs_;
        torch::Tensor targets_;
        std::mt19937_64 engine_{};
    };
}

#endif // SYNAPSE_DATA_LOADER_HPP
