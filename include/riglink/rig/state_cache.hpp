#pragma once

#include "riglink/common/commands.hpp"
#include "riglink/common/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riglink::rig {

enum class StateKey {
    FrequencyA,
    FrequencyB,
    FrequencyMain,
    FrequencySub,
    Mode,
    ActiveVfo,
    Split,
    Power,
    Ptt,
    SignalStrength,
    Rit,
    Xit,
    MemoryChannel,
    Agc,
    NoiseBlanker,
    NoiseReduction,
    Filter
};

std::string to_string(StateKey key);
StateKey frequency_key(common::Vfo vfo);

struct CacheTtl {
    std::chrono::milliseconds frequency{1000};
    std::chrono::milliseconds mode{1000};
    std::chrono::milliseconds vfo{2000};
    std::chrono::milliseconds split{1000};
    std::chrono::milliseconds power{2000};
    std::chrono::milliseconds ptt{100};
    std::chrono::milliseconds signal{200};
    std::chrono::milliseconds offset{1000};
    std::chrono::milliseconds memory{2000};
    // AGC, noise blanker, noise reduction and IF filter.
    std::chrono::milliseconds dsp{2000};
};

struct CacheStatistics {
    std::size_t entries{0};
    std::size_t fresh_entries{0};
    std::size_t hits{0};
    std::size_t misses{0};
};

// Last known radio state of one session. Not synchronised: the owning
// controller only touches it while holding its transaction lock.
class StateCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Value = common::Reply;

    explicit StateCache(CacheTtl ttl = {}, Clock clock = {});

    // Fresh value or nothing; counts hits and misses.
    std::optional<Value> get(StateKey key);

    template <typename T>
    std::optional<T> get_as(StateKey key) {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }
        if (const auto* typed = std::get_if<T>(&*value)) {
            return *typed;
        }
        return std::nullopt;
    }

    // Fresh value without touching the statistics.
    std::optional<Value> peek(StateKey key) const;

    void put(StateKey key, Value value);

    // Drops `key` and every key that depends on it.
    void invalidate(StateKey key);
    void clear();

    CacheStatistics statistics() const;
    std::chrono::milliseconds ttl(StateKey key) const;

    static const std::vector<StateKey>& dependents(StateKey key);

private:
    struct Entry {
        Value value;
        std::chrono::steady_clock::time_point stored;
    };

    CacheTtl ttl_;
    Clock clock_;
    std::unordered_map<StateKey, Entry> entries_;
    std::size_t hits_{0};
    std::size_t misses_{0};

    bool fresh(StateKey key, const Entry& entry) const;
};

}  // namespace riglink::rig
