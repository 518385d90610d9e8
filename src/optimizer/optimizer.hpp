#ifndef SYNAPSE_OPTIMIZER_HPP
#define SYNAPSE_OPTIMIZER_HPP
#include <memory>
#include <variant>

#include "registry.hpp"


namespace Synapse::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using AdamWOptions = Details::AdamWOptions;
    using AdamWDescriptor = Details::AdamWDescriptor;


    using Descriptor = std::variant<SGDDescriptor,
                                    AdamDescriptor,
                                    AdamWDescriptor>;



    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] inline constexpr auto AdamW(const AdamWOptions& options = {}) noexcept -> AdamWDescriptor {
        return AdamWDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    // The optimizer holds the accumulators (momentum, moments) and lives as long as the caller
    // keeps training the same module.
    template <class Owner>
    [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> Build(Owner& owner, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) { return Details::build_optimizer(owner, concrete); }, descriptor);
    }

}

#endif //SYNAPSE_OPTIMIZER_HPP
