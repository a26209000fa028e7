// batchpress Umbrella Header
//
// Include this single header to pull in the public batch compression API:
//   - Inputs and per item configuration (CompressionInput, AlgorithmSet, ItemConfig)
//   - Batch execution (BatchCoordinator, BatchOptions, output targets)
//   - Results and derived statistics (BatchResult, ItemResult, BatchStats)
//   - Codec registry and Accept-Encoding negotiation
//
// Lower level pieces (encoders, decoders, AtomicOutputWriter, CompressionOrchestrator) can be included
// individually when a batch is not needed.

#pragma once

// Batch execution
#include "batchpress/batch-coordinator.hpp"  // IWYU pragma: export
#include "batchpress/output-target.hpp"      // IWYU pragma: export

// Inputs & configuration
#include "batchpress/algorithm-set.hpp"      // IWYU pragma: export
#include "batchpress/compression-input.hpp"  // IWYU pragma: export
#include "batchpress/item-config.hpp"        // IWYU pragma: export

// Results
#include "batchpress/batch-result.hpp"       // IWYU pragma: export
#include "batchpress/compression-error.hpp"  // IWYU pragma: export
#include "batchpress/item-result.hpp"        // IWYU pragma: export
#include "batchpress/result-aggregator.hpp"  // IWYU pragma: export

// Codecs
#include "batchpress/accept-encoding-negotiation.hpp"  // IWYU pragma: export
#include "batchpress/codec-id.hpp"                     // IWYU pragma: export
#include "batchpress/codec-registry.hpp"               // IWYU pragma: export
