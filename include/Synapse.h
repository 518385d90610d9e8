#ifndef SYNAPSE_LIBRARY_H
#define SYNAPSE_LIBRARY_H

#include "../src/core.hpp"
#include "../src/data/data.hpp"
#include "../src/loss/loss.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/metric/metric.hpp"

#include "../src/training/metrics_log.hpp"
#include "../src/training/loop.hpp"
#include "../src/training/encode.hpp"

#include "../src/embedding/embedding.hpp"
#include "../src/common/save_load.hpp"
#include "../src/common/config.hpp"


// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the whole API: leakage-safe dataset adapter, batching, the epoch
//    loop with its metrics log, latent extraction and persistence helpers.
//  - Header-only; every module lives under src/.

#endif // SYNAPSE_LIBRARY_H
