#include "riglink/rig/state_cache.hpp"

namespace riglink::rig {

std::string to_string(StateKey key) {
    switch (key) {
        case StateKey::FrequencyA: return "frequency_a";
        case StateKey::FrequencyB: return "frequency_b";
        case StateKey::FrequencyMain: return "frequency_main";
        case StateKey::FrequencySub: return "frequency_sub";
        case StateKey::Mode: return "mode";
        case StateKey::ActiveVfo: return "active_vfo";
        case StateKey::Split: return "split";
        case StateKey::Power: return "power";
        case StateKey::Ptt: return "ptt";
        case StateKey::SignalStrength: return "signal_strength";
        case StateKey::Rit: return "rit";
        case StateKey::Xit: return "xit";
        case StateKey::MemoryChannel: return "memory_channel";
        case StateKey::Agc: return "agc";
        case StateKey::NoiseBlanker: return "noise_blanker";
        case StateKey::NoiseReduction: return "noise_reduction";
        case StateKey::Filter: return "filter";
    }
    return "unknown";
}

StateKey frequency_key(common::Vfo vfo) {
    switch (vfo) {
        case common::Vfo::A: return StateKey::FrequencyA;
        case common::Vfo::B: return StateKey::FrequencyB;
        case common::Vfo::Main: return StateKey::FrequencyMain;
        case common::Vfo::Sub: return StateKey::FrequencySub;
    }
    return StateKey::FrequencyA;
}

const std::vector<StateKey>& StateCache::dependents(StateKey key) {
    static const std::vector<StateKey> none;
    static const std::vector<StateKey> tuning{StateKey::SignalStrength};
    static const std::vector<StateKey> mode{StateKey::SignalStrength, StateKey::Filter};
    static const std::vector<StateKey> filter{StateKey::Mode};
    static const std::vector<StateKey> vfo{StateKey::Mode, StateKey::Split, StateKey::SignalStrength,
                                           StateKey::Filter};
    static const std::vector<StateKey> split{StateKey::ActiveVfo};
    static const std::vector<StateKey> memory{StateKey::FrequencyA, StateKey::FrequencyB, StateKey::FrequencyMain,
                                              StateKey::FrequencySub, StateKey::Mode, StateKey::ActiveVfo,
                                              StateKey::Split, StateKey::Rit, StateKey::Xit,
                                              StateKey::SignalStrength, StateKey::Filter};
    // RIT and XIT share one offset register on most radios.
    static const std::vector<StateKey> rit{StateKey::Xit};
    static const std::vector<StateKey> xit{StateKey::Rit};

    switch (key) {
        case StateKey::FrequencyA:
        case StateKey::FrequencyB:
        case StateKey::FrequencyMain:
        case StateKey::FrequencySub:
        case StateKey::Ptt:
            return tuning;
        case StateKey::Mode: return mode;
        case StateKey::Filter: return filter;
        case StateKey::ActiveVfo: return vfo;
        case StateKey::Split: return split;
        case StateKey::MemoryChannel: return memory;
        case StateKey::Rit: return rit;
        case StateKey::Xit: return xit;
        case StateKey::Power:
        case StateKey::SignalStrength:
        case StateKey::Agc:
        case StateKey::NoiseBlanker:
        case StateKey::NoiseReduction:
            return none;
    }
    return none;
}

StateCache::StateCache(CacheTtl ttl, Clock clock)
    : ttl_(ttl), clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }}) {}

std::chrono::milliseconds StateCache::ttl(StateKey key) const {
    switch (key) {
        case StateKey::FrequencyA:
        case StateKey::FrequencyB:
        case StateKey::FrequencyMain:
        case StateKey::FrequencySub:
            return ttl_.frequency;
        case StateKey::Mode: return ttl_.mode;
        case StateKey::ActiveVfo: return ttl_.vfo;
        case StateKey::Split: return ttl_.split;
        case StateKey::Power: return ttl_.power;
        case StateKey::Ptt: return ttl_.ptt;
        case StateKey::SignalStrength: return ttl_.signal;
        case StateKey::Rit:
        case StateKey::Xit:
            return ttl_.offset;
        case StateKey::MemoryChannel: return ttl_.memory;
        case StateKey::Agc:
        case StateKey::NoiseBlanker:
        case StateKey::NoiseReduction:
        case StateKey::Filter:
            return ttl_.dsp;
    }
    return std::chrono::milliseconds{0};
}

bool StateCache::fresh(StateKey key, const Entry& entry) const {
    return clock_() - entry.stored < ttl(key);
}

std::optional<StateCache::Value> StateCache::get(StateKey key) {
    auto value = peek(key);
    if (value) {
        ++hits_;
    } else {
        ++misses_;
    }
    return value;
}

std::optional<StateCache::Value> StateCache::peek(StateKey key) const {
    auto it = entries_.find(key);
    if (it == entries_.end() || !fresh(key, it->second)) {
        return std::nullopt;
    }
    return it->second.value;
}

void StateCache::put(StateKey key, Value value) {
    entries_[key] = Entry{std::move(value), clock_()};
}

void StateCache::invalidate(StateKey key) {
    entries_.erase(key);
    for (auto dependent : dependents(key)) {
        entries_.erase(dependent);
    }
}

void StateCache::clear() {
    entries_.clear();
}

CacheStatistics StateCache::statistics() const {
    CacheStatistics stats;
    stats.entries = entries_.size();
    for (const auto& [key, entry] : entries_) {
        if (fresh(key, entry)) {
            ++stats.fresh_entries;
        }
    }
    stats.hits = hits_;
    stats.misses = misses_;
    return stats;
}

}  // namespace riglink::rig
