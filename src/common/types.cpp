#include "riglink/common/types.hpp"

#include <cctype>

namespace riglink::common {

std::optional<Mode> mode_from_string(const std::string& text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        if (c == '-' || c == '_') {
            continue;
        }
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "LSB") return Mode::LSB;
    if (upper == "USB") return Mode::USB;
    if (upper == "CW" || upper == "CWL") return Mode::CW;
    if (upper == "CWR" || upper == "CWU") return Mode::CWR;
    if (upper == "AM") return Mode::AM;
    if (upper == "FM") return Mode::FM;
    if (upper == "FMN") return Mode::FMN;
    if (upper == "WFM") return Mode::WFM;
    if (upper == "RTTY" || upper == "RTTYL") return Mode::RTTY;
    if (upper == "RTTYR" || upper == "RTTYU") return Mode::RTTYR;
    if (upper == "DATALSB" || upper == "PKTLSB") return Mode::DataLSB;
    if (upper == "DATAUSB" || upper == "PKTUSB") return Mode::DataUSB;
    if (upper == "DATAFM" || upper == "PKTFM") return Mode::DataFM;
    return std::nullopt;
}

std::optional<AgcSpeed> agc_from_string(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "off") return AgcSpeed::Off;
    if (lower == "fast") return AgcSpeed::Fast;
    if (lower == "medium" || lower == "mid") return AgcSpeed::Medium;
    if (lower == "slow") return AgcSpeed::Slow;
    if (lower == "auto") return AgcSpeed::Auto;
    return std::nullopt;
}

}  // namespace riglink::common
