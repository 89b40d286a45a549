#include "riglink/rig/rig_controller.hpp"

#include "riglink/capability/validator.hpp"
#include "riglink/common/overloaded.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace riglink::rig {

namespace {

using common::CommandResult;
using common::ErrorCode;
using common::Reply;
using common::SessionState;

std::optional<StateKey> read_key(const common::Command& command) {
    return std::visit(
        common::overloaded{
            [](const common::ReadFrequency& c) -> std::optional<StateKey> { return frequency_key(c.vfo); },
            [](const common::ReadMode&) -> std::optional<StateKey> { return StateKey::Mode; },
            [](const common::ReadSplit&) -> std::optional<StateKey> { return StateKey::Split; },
            [](const common::ReadPower&) -> std::optional<StateKey> { return StateKey::Power; },
            [](const common::ReadPtt&) -> std::optional<StateKey> { return StateKey::Ptt; },
            [](const common::ReadSignalStrength&) -> std::optional<StateKey> { return StateKey::SignalStrength; },
            [](const common::ReadRit&) -> std::optional<StateKey> { return StateKey::Rit; },
            [](const common::ReadXit&) -> std::optional<StateKey> { return StateKey::Xit; },
            [](const common::ReadAgc&) -> std::optional<StateKey> { return StateKey::Agc; },
            [](const common::ReadNoiseBlanker&) -> std::optional<StateKey> { return StateKey::NoiseBlanker; },
            [](const common::ReadNoiseReduction&) -> std::optional<StateKey> { return StateKey::NoiseReduction; },
            [](const common::ReadFilter&) -> std::optional<StateKey> { return StateKey::Filter; },
            [](const auto&) -> std::optional<StateKey> { return std::nullopt; },
        },
        command);
}

// A write reply either carries the read-back value (CAT) or is a bare ACK
// (CI-V), in which case the requested value is what the radio accepted.
template <typename T>
Reply confirmed(const Reply& reply, T requested) {
    if (const auto* value = std::get_if<T>(&reply)) {
        return *value;
    }
    return requested;
}

// Upper bound for collecting the read-back answer that follows a refused set.
constexpr std::chrono::milliseconds kNakDrainTimeout{100};

}  // namespace

RigController::RigController(transport::TransportPtr transport,
                             const capability::CapabilityCatalog& catalog,
                             SessionOptions options)
    : transport_(std::move(transport)),
      catalog_(catalog),
      options_(std::move(options)),
      cache_(options_.cache_ttl, options_.clock) {}

RigController::~RigController() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transport_ && transport_->is_open()) {
        // Nobody is left to report a close failure to.
        static_cast<void>(close_transport());
    }
}

CommandResult RigController::connect(const std::string& model, const PortConfig& port) {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_locked(model, port);
}

CommandResult RigController::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Disconnected) {
        return {};
    }
    const auto error = close_transport();
    cache_.clear();
    transition(SessionState::Disconnected, error.empty() ? "closed " + port_.port : error);
    if (!error.empty()) {
        return {ErrorCode::Transport, error};
    }
    return {};
}

CommandResult RigController::reconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model_.empty()) {
        return {ErrorCode::NotConnected, "Session was never connected"};
    }
    // A close failure on a faulted link is expected; the reopen decides.
    const auto closed = close_transport();
    transition(SessionState::Disconnected, closed.empty() ? "reconnecting" : closed);
    return connect_locked(model_, port_);
}

capability::CapabilitiesPtr RigController::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caps_;
}

std::string RigController::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

common::Result<std::uint64_t> RigController::get_frequency(common::Vfo vfo) {
    return typed<std::uint64_t>(common::ReadFrequency{vfo});
}

CommandResult RigController::set_frequency(common::Vfo vfo, std::uint64_t hz) {
    return execute(common::SetFrequency{vfo, hz}, false).status;
}

common::Result<common::Mode> RigController::get_mode() {
    return typed<common::Mode>(common::ReadMode{});
}

CommandResult RigController::set_mode(common::Mode mode) {
    return execute(common::SetMode{mode}, false).status;
}

common::Result<common::Vfo> RigController::get_vfo() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ready_locked(); !ready.ok()) {
        return {ready, std::nullopt};
    }
    if (auto cached = cache_.get_as<common::Vfo>(StateKey::ActiveVfo)) {
        return {{}, *cached};
    }
    return {{}, current_vfo_locked()};
}

CommandResult RigController::set_vfo(common::Vfo vfo) {
    return execute(common::SelectVfo{vfo}, false).status;
}

common::Result<bool> RigController::get_split() {
    return typed<bool>(common::ReadSplit{});
}

CommandResult RigController::set_split(bool enabled) {
    return execute(common::SetSplit{enabled}, false).status;
}

common::Result<int> RigController::get_power() {
    return typed<int>(common::ReadPower{});
}

CommandResult RigController::set_power(int watts) {
    return execute(common::SetPower{watts}, false).status;
}

common::Result<bool> RigController::get_ptt() {
    return typed<bool>(common::ReadPtt{});
}

CommandResult RigController::set_ptt(bool enabled) {
    return execute(common::SetPtt{enabled}, false).status;
}

common::Result<common::SignalStrength> RigController::get_signal_strength() {
    return typed<common::SignalStrength>(common::ReadSignalStrength{});
}

common::Result<common::RitXitState> RigController::get_rit() {
    return typed<common::RitXitState>(common::ReadRit{});
}

CommandResult RigController::set_rit(const common::RitXitState& state) {
    return execute(common::SetRit{state}, false).status;
}

common::Result<common::RitXitState> RigController::get_xit() {
    return typed<common::RitXitState>(common::ReadXit{});
}

CommandResult RigController::set_xit(const common::RitXitState& state) {
    return execute(common::SetXit{state}, false).status;
}

common::Result<int> RigController::get_memory_channel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ready_locked(); !ready.ok()) {
        return {ready, std::nullopt};
    }
    if (caps_->memory.count == 0) {
        return {{ErrorCode::Capability, caps_->model + ": memory channels not supported"}, std::nullopt};
    }
    if (auto cached = cache_.get_as<int>(StateKey::MemoryChannel)) {
        return {{}, *cached};
    }
    if (memory_channel_) {
        return {{}, *memory_channel_};
    }
    return {{ErrorCode::Capability, "No memory channel selected in this session"}, std::nullopt};
}

CommandResult RigController::select_memory(int channel) {
    return execute(common::SelectMemory{channel}, false).status;
}

CommandResult RigController::store_memory(int channel) {
    return execute(common::StoreMemory{channel}, false).status;
}

CommandResult RigController::clear_memory(int channel) {
    return execute(common::ClearMemory{channel}, false).status;
}

CommandResult RigController::set_satellite_mode(bool enabled) {
    return execute(common::SetSatelliteMode{enabled}, false).status;
}

common::Result<common::AgcSpeed> RigController::get_agc() {
    return typed<common::AgcSpeed>(common::ReadAgc{});
}

CommandResult RigController::set_agc(common::AgcSpeed speed) {
    return execute(common::SetAgc{speed}, false).status;
}

common::Result<bool> RigController::get_noise_blanker() {
    return typed<bool>(common::ReadNoiseBlanker{});
}

CommandResult RigController::set_noise_blanker(bool enabled) {
    return execute(common::SetNoiseBlanker{enabled}, false).status;
}

common::Result<bool> RigController::get_noise_reduction() {
    return typed<bool>(common::ReadNoiseReduction{});
}

CommandResult RigController::set_noise_reduction(bool enabled) {
    return execute(common::SetNoiseReduction{enabled}, false).status;
}

common::Result<common::IfFilter> RigController::get_filter() {
    return typed<common::IfFilter>(common::ReadFilter{});
}

CommandResult RigController::set_filter(common::IfFilter filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto mode = execute_locked(common::ReadMode{}, true);
    if (!mode.status.ok()) {
        return mode.status;
    }
    const auto* current = std::get_if<common::Mode>(&*mode.value);
    if (!current) {
        return {ErrorCode::Internal, "Unexpected reply type for " + common::describe(common::ReadMode{})};
    }
    return execute_locked(common::SetFilter{filter, *current}, false).status;
}

common::Result<common::MemoryContents> RigController::read_memory(int channel) {
    return typed<common::MemoryContents>(common::ReadMemory{channel}, false);
}

CommandResult RigController::write_memory(const common::MemoryContents& contents) {
    return execute(common::WriteMemory{contents}, false).status;
}

BatchOutcome RigController::configure(const BatchRequest& request) {
    BatchOutcome outcome;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto steps = BatchOptimizer::plan(request, current_vfo_locked());
    for (const auto& step : steps) {
        if (outcome.failed) {
            outcome.skipped.push_back(step);
            continue;
        }
        if (state_ == SessionState::Connected) {
            if (auto cached = cache_.peek(step.key); cached && *cached == step.expected) {
                outcome.unchanged.push_back(step);
                continue;
            }
        }
        const auto result = execute_locked(step.command, false);
        if (result.status.ok()) {
            outcome.committed.push_back(step);
        } else {
            outcome.failed = step;
            outcome.failure = result.status;
        }
    }
    return outcome;
}

void RigController::invalidate_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

CacheStatistics RigController::cache_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.statistics();
}

void RigController::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

common::Result<Reply> RigController::execute(const common::Command& command, bool use_cache) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute_locked(command, use_cache);
}

CommandResult RigController::connect_locked(const std::string& model, const PortConfig& port) {
    const auto current = state_.load();
    if (current != SessionState::Disconnected && current != SessionState::Faulted) {
        return {ErrorCode::InvalidArgument, "Session already connected to " + model_};
    }

    auto caps = catalog_.lookup(model);
    if (!caps) {
        return {ErrorCode::Capability, "Unknown radio model: " + model};
    }
    if (port.civ_address) {
        if (caps->family != capability::ProtocolFamily::Civ) {
            return {ErrorCode::InvalidArgument, model + " does not use CI-V addressing"};
        }
        auto custom = std::make_shared<capability::RadioCapabilities>(*caps);
        custom->civ.radio_address = *port.civ_address;
        caps = std::move(custom);
    }

    caps_ = caps;
    codec_ = protocol::ProtocolCodec::for_model(caps_);
    model_ = model;
    port_ = port;
    cache_.clear();
    selected_vfo_.reset();
    memory_channel_.reset();
    framing_errors_ = 0;

    const int baud = port.baud > 0 ? port.baud : caps_->default_baud;
    transition(SessionState::Connecting, model + " on " + port.port + " at " + std::to_string(baud) + " baud");
    try {
        transport_->open(port.port, baud);
        run_plan(codec_->handshake());
        // The first answered query proves the radio is listening.
        transact(common::ReadFrequency{common::Vfo::A});
    } catch (const common::RigError& e) {
        const auto closed = close_transport();
        cache_.clear();
        transition(SessionState::Faulted, closed.empty() ? e.what() : std::string{e.what()} + "; " + closed);
        return e.to_result();
    } catch (const std::exception& e) {
        const auto closed = close_transport();
        transition(SessionState::Faulted, closed.empty() ? e.what() : std::string{e.what()} + "; " + closed);
        return {ErrorCode::Internal, e.what()};
    }
    transition(SessionState::Connected, model + " ready");
    return {};
}

CommandResult RigController::ready_locked() const {
    switch (state_.load()) {
        case SessionState::Connected:
            return {};
        case SessionState::Faulted:
            return {ErrorCode::NotConnected, "Session faulted; reconnect required"};
        case SessionState::Disconnected:
        case SessionState::Connecting:
        case SessionState::Transacting:
            break;
    }
    return {ErrorCode::NotConnected, "Not connected"};
}

common::Result<Reply> RigController::execute_locked(const common::Command& command, bool use_cache) {
    if (auto ready = ready_locked(); !ready.ok()) {
        return {ready, std::nullopt};
    }
    if (auto verdict = capability::Validator::validate(*caps_, command); !verdict.ok()) {
        return {verdict, std::nullopt};
    }
    if (const auto* ptt = std::get_if<common::SetPtt>(&command); ptt && ptt->enabled) {
        if (auto allowed = check_transmit_locked(); !allowed.ok()) {
            return {allowed, std::nullopt};
        }
        // Keying always starts from a live reading, never from the cache.
        auto current = execute_locked(common::ReadPtt{}, false);
        if (!current.status.ok()) {
            return current;
        }
        if (const auto* on = std::get_if<bool>(&*current.value); on && *on) {
            return current;
        }
    }
    if (use_cache) {
        if (const auto key = read_key(command)) {
            if (auto hit = cache_.get(*key)) {
                return {{}, std::move(*hit)};
            }
        }
    }

    state_ = SessionState::Transacting;
    try {
        auto reply = transact(command);
        framing_errors_ = 0;
        state_ = SessionState::Connected;
        return {{}, std::move(reply)};
    } catch (const common::RigError& e) {
        return {classify(e), std::nullopt};
    } catch (const std::exception& e) {
        state_ = SessionState::Connected;
        return {{ErrorCode::Internal, common::describe(command) + ": " + e.what()}, std::nullopt};
    }
}

common::Vfo RigController::current_vfo_locked() const {
    if (auto cached = cache_.peek(StateKey::ActiveVfo)) {
        if (const auto* vfo = std::get_if<common::Vfo>(&*cached)) {
            return *vfo;
        }
    }
    return selected_vfo_.value_or(common::Vfo::A);
}

// Keying is refused outside the model's transmit ranges and, with a region
// configured, outside that region's amateur bands.
CommandResult RigController::check_transmit_locked() {
    const auto vfo = current_vfo_locked();
    std::uint64_t hz = 0;
    if (auto cached = cache_.peek(frequency_key(vfo)); cached && std::holds_alternative<std::uint64_t>(*cached)) {
        hz = std::get<std::uint64_t>(*cached);
    } else {
        auto live = execute_locked(common::ReadFrequency{vfo}, false);
        if (!live.status.ok()) {
            return live.status;
        }
        const auto* value = std::get_if<std::uint64_t>(&*live.value);
        if (!value) {
            return {ErrorCode::Internal, "Unexpected reply type for " + common::describe(common::ReadFrequency{vfo})};
        }
        hz = *value;
    }
    if (!caps_->can_transmit(hz)) {
        return {ErrorCode::Capability,
                caps_->model + ": " + std::to_string(hz) + " Hz is outside the transmit ranges"};
    }
    if (options_.region && !capability::find_band(*options_.region, hz)) {
        return {ErrorCode::Capability,
                std::to_string(hz) + " Hz is outside the amateur bands of " + capability::to_string(*options_.region)};
    }
    return {};
}

Reply RigController::transact(const common::Command& command) {
    const auto plan = codec_->encode(command);
    std::size_t completed = 0;
    try {
        const auto replies = run_plan(plan, completed);
        auto reply = codec_->decode(command, replies);
        record(command, reply, plan);
        return reply;
    } catch (const common::ProtocolNakError&) {
        settle_partial(plan, completed);
        drain_after_nak(plan);
        throw;
    } catch (const common::RigError&) {
        settle_partial(plan, completed);
        throw;
    }
}

std::vector<common::Bytes> RigController::run_plan(const protocol::Plan& plan) {
    std::size_t completed = 0;
    return run_plan(plan, completed);
}

// `completed` counts exchanges the radio has taken: written for None,
// acknowledged for Ack, answered for Data.
std::vector<common::Bytes> RigController::run_plan(const protocol::Plan& plan, std::size_t& completed) {
    std::vector<common::Bytes> replies;
    completed = 0;
    if (plan.exchanges.empty()) {
        return replies;
    }
    transport_->discard_input();
    for (const auto& exchange : plan.exchanges) {
        transport_->write(exchange.request);
        switch (exchange.reply) {
            case protocol::ReplyKind::None:
                break;
            case protocol::ReplyKind::Ack:
                codec_->expect_ack(read_reply());
                break;
            case protocol::ReplyKind::Data:
                replies.push_back(read_reply());
                break;
        }
        ++completed;
    }
    return replies;
}

// A plan that fails after its VFO select went through has still moved the
// radio to that VFO. An acknowledged select is applied; one that was only
// written leaves the active VFO unknown.
void RigController::settle_partial(const protocol::Plan& plan, std::size_t completed) {
    if (!plan.selects_vfo || completed == 0) {
        return;
    }
    if (plan.exchanges.front().reply == protocol::ReplyKind::Ack) {
        apply_vfo_selection(*plan.selects_vfo);
        return;
    }
    cache_.invalidate(StateKey::ActiveVfo);
    selected_vfo_.reset();
}

// CAT radios answer a refused set with an error marker and still answer the
// read-back that followed it. Collect that answer so it cannot pair with the
// next request.
void RigController::drain_after_nak(const protocol::Plan& plan) {
    const auto has_write_only = std::any_of(plan.exchanges.begin(), plan.exchanges.end(), [](const auto& exchange) {
        return exchange.reply == protocol::ReplyKind::None;
    });
    if (!has_write_only) {
        return;
    }
    try {
        static_cast<void>(
            transport_->read_until(codec_->terminator(), std::min(options_.response_timeout, kNakDrainTimeout)));
    } catch (const common::TimeoutError&) {
        // Nothing left behind.
    }
}

void RigController::apply_vfo_selection(common::Vfo vfo) {
    // Re-selecting the VFO that is already active leaves its state intact.
    if (selected_vfo_ != vfo) {
        cache_.invalidate(StateKey::ActiveVfo);
    }
    cache_.put(StateKey::ActiveVfo, vfo);
    selected_vfo_ = vfo;
}

common::Bytes RigController::read_reply() {
    const auto deadline = std::chrono::steady_clock::now() + options_.response_timeout;
    for (;;) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw common::TimeoutError("Only unsolicited traffic within " +
                                       std::to_string(options_.response_timeout.count()) + " ms");
        }
        auto bytes = transport_->read_until(codec_->terminator(), remaining);
        if (!codec_->is_unsolicited(bytes)) {
            return bytes;
        }
    }
}

void RigController::record(const common::Command& command, const Reply& reply, const protocol::Plan& plan) {
    if (plan.selects_vfo) {
        apply_vfo_selection(*plan.selects_vfo);
    }

    const auto store = [&](StateKey key, Reply value) {
        cache_.invalidate(key);
        cache_.put(key, std::move(value));
    };

    std::visit(
        common::overloaded{
            [&](const common::ReadFrequency& c) { cache_.put(frequency_key(c.vfo), reply); },
            [&](const common::SetFrequency& c) { store(frequency_key(c.vfo), confirmed(reply, c.hz)); },
            [&](const common::ReadMode&) { cache_.put(StateKey::Mode, reply); },
            [&](const common::SetMode& c) { store(StateKey::Mode, confirmed(reply, c.mode)); },
            [&](const common::SelectVfo& c) {
                apply_vfo_selection(std::get<common::Vfo>(confirmed(reply, c.vfo)));
            },
            [&](const common::ReadSplit&) { cache_.put(StateKey::Split, reply); },
            [&](const common::SetSplit& c) { store(StateKey::Split, confirmed(reply, c.enabled)); },
            [&](const common::ReadPower&) { cache_.put(StateKey::Power, reply); },
            [&](const common::SetPower& c) { store(StateKey::Power, confirmed(reply, c.watts)); },
            [&](const common::ReadPtt&) { cache_.put(StateKey::Ptt, reply); },
            [&](const common::SetPtt& c) { store(StateKey::Ptt, confirmed(reply, c.enabled)); },
            [&](const common::ReadSignalStrength&) { cache_.put(StateKey::SignalStrength, reply); },
            [&](const common::ReadRit&) { cache_.put(StateKey::Rit, reply); },
            [&](const common::SetRit& c) { store(StateKey::Rit, confirmed(reply, c.state)); },
            [&](const common::ReadXit&) { cache_.put(StateKey::Xit, reply); },
            [&](const common::SetXit& c) { store(StateKey::Xit, confirmed(reply, c.state)); },
            [&](const common::SelectMemory& c) {
                const auto value = confirmed(reply, c.channel);
                store(StateKey::MemoryChannel, value);
                memory_channel_ = std::get<int>(value);
            },
            [&](const common::StoreMemory&) {},
            [&](const common::ClearMemory&) {},
            // Satellite mode rearranges the VFOs.
            [&](const common::SetSatelliteMode&) { cache_.clear(); },
            [&](const common::ReadAgc&) { cache_.put(StateKey::Agc, reply); },
            [&](const common::SetAgc& c) { store(StateKey::Agc, confirmed(reply, c.speed)); },
            [&](const common::ReadNoiseBlanker&) { cache_.put(StateKey::NoiseBlanker, reply); },
            [&](const common::SetNoiseBlanker& c) { store(StateKey::NoiseBlanker, confirmed(reply, c.enabled)); },
            [&](const common::ReadNoiseReduction&) { cache_.put(StateKey::NoiseReduction, reply); },
            [&](const common::SetNoiseReduction& c) {
                store(StateKey::NoiseReduction, confirmed(reply, c.enabled));
            },
            [&](const common::ReadFilter&) { cache_.put(StateKey::Filter, reply); },
            [&](const common::SetFilter& c) {
                // The filter byte can turn FM into FM-N; the mode is read again.
                store(StateKey::Filter, confirmed(reply, c.filter));
            },
            // Memory contents are read on demand and never cached.
            [&](const common::ReadMemory&) {},
            [&](const common::WriteMemory&) {},
        },
        command);
}

CommandResult RigController::classify(const common::RigError& error) {
    auto result = error.to_result();

    if (result.code == ErrorCode::Timeout) {
        const auto* timeout = dynamic_cast<const common::TimeoutError*>(&error);
        if (!timeout || timeout->partial().empty()) {
            fault(error.what());
            return result;
        }
        result = {ErrorCode::Framing,
                  "Incomplete frame (" + std::to_string(timeout->partial().size()) + " bytes): " + error.what()};
    }

    switch (result.code) {
        case ErrorCode::Framing:
            if (++framing_errors_ >= options_.max_framing_errors) {
                fault(std::to_string(framing_errors_) + " consecutive framing errors: " + result.message);
            } else {
                state_ = SessionState::Connected;
            }
            return result;
        case ErrorCode::Transport:
            fault(result.message);
            return result;
        default:
            state_ = SessionState::Connected;
            return result;
    }
}

void RigController::fault(const std::string& detail) {
    cache_.clear();
    transition(SessionState::Faulted, detail);
}

void RigController::transition(SessionState next, const std::string& detail) {
    state_ = next;
    if (listener_) {
        listener_(next, detail);
    }
}

std::string RigController::close_transport() {
    try {
        transport_->close();
    } catch (const common::TransportError& e) {
        return e.what();
    }
    return {};
}

template <typename T>
common::Result<T> RigController::typed(const common::Command& command, bool use_cache) {
    auto result = execute(command, use_cache);
    if (!result.status.ok()) {
        return {result.status, std::nullopt};
    }
    if (const auto* value = std::get_if<T>(&*result.value)) {
        return {{}, *value};
    }
    return {{ErrorCode::Internal, "Unexpected reply type for " + common::describe(command)}, std::nullopt};
}

}  // namespace riglink::rig
