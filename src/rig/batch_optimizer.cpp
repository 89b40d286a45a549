#include "riglink/rig/batch_optimizer.hpp"

namespace riglink::rig {

std::vector<BatchStep> BatchOptimizer::plan(const BatchRequest& request, common::Vfo current_vfo) {
    std::vector<BatchStep> steps;
    const auto target = request.vfo.value_or(current_vfo);

    if (request.vfo) {
        steps.push_back({common::SelectVfo{*request.vfo}, StateKey::ActiveVfo, *request.vfo});
    }
    if (request.mode) {
        steps.push_back({common::SetMode{*request.mode}, StateKey::Mode, *request.mode});
    }
    if (request.frequency_hz) {
        steps.push_back({common::SetFrequency{target, *request.frequency_hz}, frequency_key(target),
                         *request.frequency_hz});
    }
    if (request.split) {
        steps.push_back({common::SetSplit{*request.split}, StateKey::Split, *request.split});
    }
    if (request.power_watts) {
        steps.push_back({common::SetPower{*request.power_watts}, StateKey::Power, *request.power_watts});
    }
    return steps;
}

}  // namespace riglink::rig
