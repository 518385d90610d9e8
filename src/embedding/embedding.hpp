#ifndef SYNAPSE_EMBEDDING_HPP
#define SYNAPSE_EMBEDDING_HPP

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "details/pca.hpp"
#include "../core.hpp"

namespace Synapse::Embedding {
    // Caller-owned memo of computed embeddings. Nothing is cached behind the caller's back.
    class Cache {
    public:
        [[nodiscard]] bool contains(const std::string& key) const { return entries_.count(key) != 0; }

        [[nodiscard]] const torch::Tensor& get(const std::string& key) const
        {
            const auto it = entries_.find(key);
            if (it == entries_.end()) {
                throw IndexOutOfRange("No cached embedding under '" + key + "'.");
            }
            return it->second;
        }

        void put(const std::string& key, torch::Tensor value) { entries_[key] = std::move(value); }

        const torch::Tensor& get_or_compute(const std::string& key, const std::function<torch::Tensor()>& compute)
        {
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                it = entries_.emplace(key, compute()).first;
            }
            return it->second;
        }

        void erase(const std::string& key) { entries_.erase(key); }
        void clear() noexcept { entries_.clear(); }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    private:
        std::map<std::string, torch::Tensor> entries_{};
    };

    struct Precomputed {
        torch::Tensor data;
    };

    struct Deferred {
        std::function<torch::Tensor()> compute;
    };

    using Source = std::variant<Precomputed, Deferred>;

    [[nodiscard]] inline Source FromTensor(torch::Tensor data) { return Precomputed{std::move(data)}; }
    [[nodiscard]] inline Source FromFunction(std::function<torch::Tensor()> compute) { return Deferred{std::move(compute)}; }

    namespace Details {
        inline const std::function<torch::Tensor()>& checked(const Deferred& deferred)
        {
            if (!deferred.compute) {
                throw InvalidConfiguration("Deferred embedding source has no compute function.");
            }
            return deferred.compute;
        }
    }

    // Evaluates a Deferred source every time it is called.
    [[nodiscard]] inline torch::Tensor Resolve(const Source& source)
    {
        return std::visit(Overloaded{
            [](const Precomputed& precomputed) { return precomputed.data; },
            [](const Deferred& deferred) { return Details::checked(deferred)(); }
        }, source);
    }

    // A Deferred result is computed once per key and served from `cache` afterwards.
    [[nodiscard]] inline torch::Tensor Resolve(const Source& source, Cache& cache, const std::string& key)
    {
        return std::visit(Overloaded{
            [](const Precomputed& precomputed) { return precomputed.data; },
            [&](const Deferred& deferred) { return cache.get_or_compute(key, Details::checked(deferred)); }
        }, source);
    }
}

#endif // SYNAPSE_EMBEDDING_HPP
