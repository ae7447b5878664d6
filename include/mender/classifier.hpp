#pragma once

// mender/classifier.hpp: Failure classification of captured program output.
//
// classify() is pure, total and deterministic: the same output always yields
// the same category and it never fails. Priority, first match wins:
//   1. memory-kill signature              -> "MemoryError"
//   2. executor timeout marker            -> "TimeoutError"
//   3. last "<Identifier>(Error|Exception|Warning):" occurrence -> identifier
//   4. "No module named" phrasing         -> "ModuleNotFoundError"
//   5. anything else                      -> "RuntimeError"

#include <cstdint>
#include <string>

#include "mender/types.hpp"

namespace mender {

std::string classify(const std::string& output);

// classify() plus detail text, failing program line and undefined name.
FailureContext analyze(const std::string& output);

// Context for a finished trace. Infrastructure traces keep their recorded
// category; program failures are re-analyzed from the output.
FailureContext failure_context(const ExecutionTrace& trace);

// Synthetic diagnostic lines appended by the executor.
std::string memory_kill_marker(std::uint64_t memory_limit_mb);
std::string timeout_marker(std::uint64_t timeout_ms);

}  // namespace mender
