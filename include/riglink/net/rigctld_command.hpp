#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace riglink::net {

enum class RigctldVerb {
    SetFreq,
    GetFreq,
    SetMode,
    GetMode,
    SetVfo,
    GetVfo,
    SetPtt,
    GetPtt,
    SetSplitVfo,
    GetSplitVfo,
    SetSplitFreq,
    GetSplitFreq,
    SetSplitMode,
    GetSplitMode,
    SetLevel,
    GetLevel,
    SetFunc,
    GetFunc,
    SetRit,
    GetRit,
    SetXit,
    GetXit,
    SetMem,
    GetMem,
    Power2mW,
    MW2Power,
    DumpCaps,
    DumpState,
    ChkVfo,
    SetExtResponse,
    Quit
};

// Hamlib long command name, used in extended responses.
std::string long_name(RigctldVerb verb);

struct RigctldCommand {
    RigctldVerb verb{RigctldVerb::GetFreq};
    std::vector<std::string> args;
    // `+` prefix: answer this command in the extended format.
    bool extended{false};
};

class RigctldParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parses one client line: a single-letter command (`F 14074000`), a
// backslash long command (`\set_freq 14074000`), either optionally
// prefixed with `+`. Argument count and numeric shape are checked here.
class RigctldParser {
public:
    static RigctldCommand parse(std::string_view line);

    // Hamlib sends frequencies as decimals ("14074000.000000").
    static std::uint64_t parse_frequency(const std::string& text);
    static long parse_integer(const std::string& text, const char* name);
    static double parse_real(const std::string& text, const char* name);
};

}  // namespace riglink::net
