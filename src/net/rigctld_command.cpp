#include "riglink/net/rigctld_command.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <sstream>

namespace riglink::net {

namespace {

struct VerbSpec {
    char letter;  // '\0' for long-only commands
    const char* name;
    RigctldVerb verb;
    std::size_t min_args;
};

constexpr std::array<VerbSpec, 31> kVerbs{{
    {'F', "set_freq", RigctldVerb::SetFreq, 1},
    {'f', "get_freq", RigctldVerb::GetFreq, 0},
    {'M', "set_mode", RigctldVerb::SetMode, 1},
    {'m', "get_mode", RigctldVerb::GetMode, 0},
    {'V', "set_vfo", RigctldVerb::SetVfo, 1},
    {'v', "get_vfo", RigctldVerb::GetVfo, 0},
    {'T', "set_ptt", RigctldVerb::SetPtt, 1},
    {'t', "get_ptt", RigctldVerb::GetPtt, 0},
    {'S', "set_split_vfo", RigctldVerb::SetSplitVfo, 1},
    {'s', "get_split_vfo", RigctldVerb::GetSplitVfo, 0},
    {'I', "set_split_freq", RigctldVerb::SetSplitFreq, 1},
    {'i', "get_split_freq", RigctldVerb::GetSplitFreq, 0},
    {'X', "set_split_mode", RigctldVerb::SetSplitMode, 1},
    {'x', "get_split_mode", RigctldVerb::GetSplitMode, 0},
    {'L', "set_level", RigctldVerb::SetLevel, 2},
    {'l', "get_level", RigctldVerb::GetLevel, 1},
    {'U', "set_func", RigctldVerb::SetFunc, 2},
    {'u', "get_func", RigctldVerb::GetFunc, 1},
    {'J', "set_rit", RigctldVerb::SetRit, 1},
    {'j', "get_rit", RigctldVerb::GetRit, 0},
    {'Z', "set_xit", RigctldVerb::SetXit, 1},
    {'z', "get_xit", RigctldVerb::GetXit, 0},
    {'E', "set_mem", RigctldVerb::SetMem, 1},
    {'e', "get_mem", RigctldVerb::GetMem, 0},
    {'2', "power2mW", RigctldVerb::Power2mW, 3},
    {'4', "mW2power", RigctldVerb::MW2Power, 3},
    {'\0', "dump_caps", RigctldVerb::DumpCaps, 0},
    {'\0', "dump_state", RigctldVerb::DumpState, 0},
    {'\0', "chk_vfo", RigctldVerb::ChkVfo, 0},
    {'\0', "set_ext_response", RigctldVerb::SetExtResponse, 1},
    {'q', "quit", RigctldVerb::Quit, 0},
}};

const VerbSpec* find_letter(char letter) {
    for (const auto& spec : kVerbs) {
        if (spec.letter != '\0' && spec.letter == letter) {
            return &spec;
        }
    }
    return nullptr;
}

const VerbSpec* find_name(const std::string& name) {
    for (const auto& spec : kVerbs) {
        if (name == spec.name) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> split_words(std::string_view text) {
    std::istringstream stream{std::string{text}};
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

void check_arguments(const RigctldCommand& command) {
    const auto& args = command.args;
    switch (command.verb) {
        case RigctldVerb::SetFreq:
        case RigctldVerb::SetSplitFreq:
            RigctldParser::parse_frequency(args[0]);
            break;
        case RigctldVerb::SetPtt:
        case RigctldVerb::SetSplitVfo:
        case RigctldVerb::SetExtResponse:
        case RigctldVerb::SetRit:
        case RigctldVerb::SetXit:
        case RigctldVerb::SetMem:
            RigctldParser::parse_integer(args[0], long_name(command.verb).c_str());
            break;
        case RigctldVerb::SetMode:
        case RigctldVerb::SetSplitMode:
            if (args.size() > 1) {
                RigctldParser::parse_integer(args[1], "passband");
            }
            break;
        case RigctldVerb::SetLevel:
            RigctldParser::parse_real(args[1], "level value");
            break;
        case RigctldVerb::SetFunc:
            RigctldParser::parse_integer(args[1], "func value");
            break;
        case RigctldVerb::Power2mW:
            RigctldParser::parse_real(args[0], "power");
            RigctldParser::parse_frequency(args[1]);
            break;
        case RigctldVerb::MW2Power:
            RigctldParser::parse_integer(args[0], "power");
            RigctldParser::parse_frequency(args[1]);
            break;
        default:
            break;
    }
}

}  // namespace

std::string long_name(RigctldVerb verb) {
    for (const auto& spec : kVerbs) {
        if (spec.verb == verb) {
            return spec.name;
        }
    }
    return "unknown";
}

RigctldCommand RigctldParser::parse(std::string_view line) {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        throw RigctldParseError("Empty command");
    }

    RigctldCommand command;
    if (line.front() == '+') {
        command.extended = true;
        line.remove_prefix(1);
    }

    const VerbSpec* spec = nullptr;
    std::vector<std::string> words;
    if (!line.empty() && line.front() == '\\') {
        words = split_words(line.substr(1));
        if (words.empty()) {
            throw RigctldParseError("Missing command name");
        }
        spec = find_name(words.front());
    } else {
        words = split_words(line);
        if (words.empty()) {
            throw RigctldParseError("Empty command");
        }
        if (words.front().size() == 1) {
            spec = find_letter(words.front().front());
        }
    }
    if (!spec) {
        throw RigctldParseError("Unknown command: '" + words.front() + "'");
    }

    command.verb = spec->verb;
    command.args.assign(words.begin() + 1, words.end());
    if (command.args.size() < spec->min_args) {
        throw RigctldParseError("Missing parameter for " + std::string{spec->name});
    }
    check_arguments(command);
    return command;
}

std::uint64_t RigctldParser::parse_frequency(const std::string& text) {
    const double value = parse_real(text, "frequency");
    if (value < 0.0 || !std::isfinite(value)) {
        throw RigctldParseError("Invalid value '" + text + "' for frequency");
    }
    return static_cast<std::uint64_t>(std::llround(value));
}

long RigctldParser::parse_integer(const std::string& text, const char* name) {
    std::size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::logic_error&) {
        throw RigctldParseError("Invalid value '" + text + "' for " + name);
    }
    if (used != text.size()) {
        throw RigctldParseError("Invalid value '" + text + "' for " + name);
    }
    return value;
}

double RigctldParser::parse_real(const std::string& text, const char* name) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw RigctldParseError("Invalid value '" + text + "' for " + name);
    }
    if (used != text.size()) {
        throw RigctldParseError("Invalid value '" + text + "' for " + name);
    }
    return value;
}

}  // namespace riglink::net
