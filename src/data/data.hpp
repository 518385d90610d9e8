#ifndef SYNAPSE_DATA_HPP
#define SYNAPSE_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/types.hpp"
#include "details/generation.hpp"
#include "details/split.hpp"
#include "transform/normalization/minmax.hpp"
#include "details/view.hpp"
#include "details/loader.hpp"
#endif // SYNAPSE_DATA_HPP
