#include "riglink/common/commands.hpp"

#include "riglink/common/overloaded.hpp"

namespace riglink::common {

namespace {

std::string on_off(bool enabled) { return enabled ? "on" : "off"; }

std::string offset_text(const RitXitState& state) {
    return on_off(state.enabled) + " " + std::to_string(state.offset_hz) + " Hz";
}

}  // namespace

std::string describe(const Command& command) {
    return std::visit(
        overloaded{
            [](const ReadFrequency& c) { return "read frequency VFO " + to_string(c.vfo); },
            [](const SetFrequency& c) {
                return "set frequency VFO " + to_string(c.vfo) + " " + std::to_string(c.hz) + " Hz";
            },
            [](const ReadMode&) { return std::string{"read mode"}; },
            [](const SetMode& c) { return "set mode " + to_string(c.mode); },
            [](const SelectVfo& c) { return "select VFO " + to_string(c.vfo); },
            [](const ReadSplit&) { return std::string{"read split"}; },
            [](const SetSplit& c) { return "set split " + on_off(c.enabled); },
            [](const ReadPower&) { return std::string{"read power"}; },
            [](const SetPower& c) { return "set power " + std::to_string(c.watts) + " W"; },
            [](const ReadPtt&) { return std::string{"read PTT"}; },
            [](const SetPtt& c) { return "set PTT " + on_off(c.enabled); },
            [](const ReadSignalStrength&) { return std::string{"read signal strength"}; },
            [](const ReadRit&) { return std::string{"read RIT"}; },
            [](const SetRit& c) { return "set RIT " + offset_text(c.state); },
            [](const ReadXit&) { return std::string{"read XIT"}; },
            [](const SetXit& c) { return "set XIT " + offset_text(c.state); },
            [](const SelectMemory& c) { return "select memory " + std::to_string(c.channel); },
            [](const StoreMemory& c) { return "store memory " + std::to_string(c.channel); },
            [](const ClearMemory& c) { return "clear memory " + std::to_string(c.channel); },
            [](const SetSatelliteMode& c) { return "set satellite mode " + on_off(c.enabled); },
            [](const ReadAgc&) { return std::string{"read AGC"}; },
            [](const SetAgc& c) { return "set AGC " + to_string(c.speed); },
            [](const ReadNoiseBlanker&) { return std::string{"read noise blanker"}; },
            [](const SetNoiseBlanker& c) { return "set noise blanker " + on_off(c.enabled); },
            [](const ReadNoiseReduction&) { return std::string{"read noise reduction"}; },
            [](const SetNoiseReduction& c) { return "set noise reduction " + on_off(c.enabled); },
            [](const ReadFilter&) { return std::string{"read IF filter"}; },
            [](const SetFilter& c) { return "set IF filter " + to_string(c.filter) + " in " + to_string(c.mode); },
            [](const ReadMemory& c) { return "read memory " + std::to_string(c.channel); },
            [](const WriteMemory& c) {
                return "write memory " + std::to_string(c.contents.channel) + " " +
                       std::to_string(c.contents.frequency_hz) + " Hz " + to_string(c.contents.mode);
            },
        },
        command);
}

bool is_query(const Command& command) {
    return std::holds_alternative<ReadFrequency>(command) || std::holds_alternative<ReadMode>(command) ||
           std::holds_alternative<ReadSplit>(command) || std::holds_alternative<ReadPower>(command) ||
           std::holds_alternative<ReadPtt>(command) || std::holds_alternative<ReadSignalStrength>(command) ||
           std::holds_alternative<ReadRit>(command) || std::holds_alternative<ReadXit>(command) ||
           std::holds_alternative<ReadAgc>(command) || std::holds_alternative<ReadNoiseBlanker>(command) ||
           std::holds_alternative<ReadNoiseReduction>(command) || std::holds_alternative<ReadFilter>(command) ||
           std::holds_alternative<ReadMemory>(command);
}

}  // namespace riglink::common
