#ifndef SYNAPSE_COMMON_ERRORS_HPP
#define SYNAPSE_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

#include <c10/util/Exception.h>

namespace Synapse {
    // Bad split fraction, empty or malformed dataset, bad option values.
    class InvalidConfiguration : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Normalization source with zero spread.
    class DegenerateData : public std::domain_error {
    public:
        using std::domain_error::domain_error;
    };

    class IndexOutOfRange : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
    };

    // A batch range produced no batch for an epoch phase.
    class EmptyIterator : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    // Raised by LibTorch when a prediction does not fit the loss; never wrapped.
    using ShapeMismatch = c10::Error;
}

#endif // SYNAPSE_COMMON_ERRORS_HPP
