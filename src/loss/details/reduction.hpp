#ifndef SYNAPSE_LOSS_REDUCTION_HPP
#define SYNAPSE_LOSS_REDUCTION_HPP

#include <torch/torch.h>
#include <type_traits>

namespace Synapse::Loss::Details {

    enum class Reduction { Mean, Sum };

    // Use: to_torch_reduction<torch::nn::functional::MSELossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

}

#endif // SYNAPSE_LOSS_REDUCTION_HPP
