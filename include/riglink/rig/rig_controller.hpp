#pragma once

#include "riglink/capability/band_plan.hpp"
#include "riglink/capability/capabilities.hpp"
#include "riglink/capability/catalog.hpp"
#include "riglink/common/commands.hpp"
#include "riglink/common/errors.hpp"
#include "riglink/common/types.hpp"
#include "riglink/protocol/plan.hpp"
#include "riglink/protocol/protocol_codec.hpp"
#include "riglink/rig/batch_optimizer.hpp"
#include "riglink/rig/state_cache.hpp"
#include "riglink/transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace riglink::rig {

struct PortConfig {
    std::string port;
    int baud{0};  // 0 selects the model's default rate
    std::optional<std::uint8_t> civ_address;
};

struct SessionOptions {
    std::chrono::milliseconds response_timeout{1000};
    int max_framing_errors{3};
    CacheTtl cache_ttl;
    StateCache::Clock clock;
    // When set, keying is also limited to this region's amateur bands.
    std::optional<capability::Region> region;
};

// Invoked on every session state change except the Connected/Transacting
// bracket around each transaction. Called with the transaction lock held.
using StateListener = std::function<void(common::SessionState state, const std::string& detail)>;

// One serial session with one radio. Every operation is a blocking,
// single-flight transaction; concurrent callers queue on the session mutex.
class RigController {
public:
    RigController(transport::TransportPtr transport,
                  const capability::CapabilityCatalog& catalog,
                  SessionOptions options = {});
    ~RigController();

    RigController(const RigController&) = delete;
    RigController& operator=(const RigController&) = delete;

    common::CommandResult connect(const std::string& model, const PortConfig& port);
    common::CommandResult disconnect();
    common::CommandResult reconnect();

    common::SessionState state() const noexcept { return state_.load(); }
    capability::CapabilitiesPtr capabilities() const;
    std::string model() const;

    common::Result<std::uint64_t> get_frequency(common::Vfo vfo = common::Vfo::A);
    common::CommandResult set_frequency(common::Vfo vfo, std::uint64_t hz);

    common::Result<common::Mode> get_mode();
    common::CommandResult set_mode(common::Mode mode);

    // No protocol can read the active VFO back; this reports the last VFO
    // selected during the session (VFO A until one is selected).
    common::Result<common::Vfo> get_vfo();
    common::CommandResult set_vfo(common::Vfo vfo);

    common::Result<bool> get_split();
    common::CommandResult set_split(bool enabled);

    common::Result<int> get_power();
    common::CommandResult set_power(int watts);

    common::Result<bool> get_ptt();
    common::CommandResult set_ptt(bool enabled);

    common::Result<common::SignalStrength> get_signal_strength();

    common::Result<common::RitXitState> get_rit();
    common::CommandResult set_rit(const common::RitXitState& state);
    common::Result<common::RitXitState> get_xit();
    common::CommandResult set_xit(const common::RitXitState& state);

    common::Result<int> get_memory_channel();
    common::CommandResult select_memory(int channel);
    common::CommandResult store_memory(int channel);
    common::CommandResult clear_memory(int channel);

    common::CommandResult set_satellite_mode(bool enabled);

    common::Result<common::AgcSpeed> get_agc();
    common::CommandResult set_agc(common::AgcSpeed speed);

    common::Result<bool> get_noise_blanker();
    common::CommandResult set_noise_blanker(bool enabled);
    common::Result<bool> get_noise_reduction();
    common::CommandResult set_noise_reduction(bool enabled);

    common::Result<common::IfFilter> get_filter();
    // Keeps the current mode; the filter is sent together with it.
    common::CommandResult set_filter(common::IfFilter filter);

    common::Result<common::MemoryContents> read_memory(int channel);
    common::CommandResult write_memory(const common::MemoryContents& contents);

    BatchOutcome configure(const BatchRequest& request);

    void invalidate_cache();
    CacheStatistics cache_statistics() const;

    void set_state_listener(StateListener listener);

    // Validates, encodes and runs one command. Reads are answered from the
    // cache when `use_cache` is set and a fresh entry exists.
    common::Result<common::Reply> execute(const common::Command& command, bool use_cache = true);

private:
    transport::TransportPtr transport_;
    const capability::CapabilityCatalog& catalog_;
    SessionOptions options_;

    mutable std::mutex mutex_;
    std::atomic<common::SessionState> state_{common::SessionState::Disconnected};
    StateListener listener_;

    capability::CapabilitiesPtr caps_;
    std::optional<protocol::ProtocolCodec> codec_;
    std::string model_;
    PortConfig port_;
    StateCache cache_;
    std::optional<common::Vfo> selected_vfo_;
    std::optional<int> memory_channel_;
    int framing_errors_{0};

    common::CommandResult connect_locked(const std::string& model, const PortConfig& port);
    common::CommandResult ready_locked() const;
    common::Result<common::Reply> execute_locked(const common::Command& command, bool use_cache);
    common::CommandResult check_transmit_locked();
    common::Vfo current_vfo_locked() const;
    common::Reply transact(const common::Command& command);
    std::vector<common::Bytes> run_plan(const protocol::Plan& plan);
    std::vector<common::Bytes> run_plan(const protocol::Plan& plan, std::size_t& completed);
    void settle_partial(const protocol::Plan& plan, std::size_t completed);
    void drain_after_nak(const protocol::Plan& plan);
    void apply_vfo_selection(common::Vfo vfo);
    common::Bytes read_reply();
    void record(const common::Command& command, const common::Reply& reply, const protocol::Plan& plan);
    common::CommandResult classify(const common::RigError& error);
    void fault(const std::string& detail);
    void transition(common::SessionState next, const std::string& detail);
    std::string close_transport();

    template <typename T>
    common::Result<T> typed(const common::Command& command, bool use_cache = true);
};

}  // namespace riglink::rig
