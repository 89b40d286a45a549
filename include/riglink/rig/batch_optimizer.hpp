#pragma once

#include "riglink/common/commands.hpp"
#include "riglink/common/types.hpp"
#include "riglink/rig/state_cache.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riglink::rig {

struct BatchRequest {
    std::optional<common::Vfo> vfo;
    std::optional<common::Mode> mode;
    std::optional<std::uint64_t> frequency_hz;
    std::optional<bool> split;
    std::optional<int> power_watts;

    bool empty() const noexcept {
        return !vfo && !mode && !frequency_hz && !split && !power_watts;
    }
};

struct BatchStep {
    common::Command command;
    // Cache entry that already holding `expected` makes the step redundant.
    StateKey key;
    common::Reply expected;
};

struct BatchOutcome {
    std::vector<BatchStep> committed;
    std::vector<BatchStep> unchanged;
    std::optional<BatchStep> failed;
    common::CommandResult failure;
    std::vector<BatchStep> skipped;

    bool ok() const noexcept { return !failed.has_value(); }
};

// Orders a batch as VFO, mode, frequency, split, power. Mode precedes
// frequency because tuning steps depend on mode; power goes last so the
// radio is never left at high power on an intermediate setting.
class BatchOptimizer {
public:
    // Without a VFO in the request the frequency goes to `current_vfo`, the
    // VFO the session has selected.
    static std::vector<BatchStep> plan(const BatchRequest& request, common::Vfo current_vfo);
};

}  // namespace riglink::rig
