#pragma once

#include "riglink/common/types.hpp"
#include "riglink/config/types.hpp"

#include <asio/io_context.hpp>
#include <dts/common/telemetry/event_bus.hpp>
#include <dts/common/telemetry/ring_buffer.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace riglink::telemetry {

namespace tags {
constexpr auto READY = "riglink.ready";
constexpr auto RADIO_STATE = "riglink.radio.state";
constexpr auto FREQUENCY = "riglink.radio.frequency";
constexpr auto PTT = "riglink.radio.ptt";
constexpr auto FAULT = "riglink.radio.fault";
}  // namespace tags

class TelemetryHub {
public:
    // Sees every event after it reaches the event bus, on the publishing thread.
    using Listener = std::function<void(const std::string& tag, const nlohmann::json& payload)>;

    TelemetryHub(asio::io_context& io, const config::TelemetryConfig& config);

    dts::common::telemetry::EventBus& event_bus() noexcept { return event_bus_; }

    void publish_ready(const std::string& service_id, std::size_t radio_count);
    void publish_radio_state(const std::string& radio_id, common::SessionState state, const std::string& detail);
    void publish_frequency(const std::string& radio_id, common::Vfo vfo, std::uint64_t hz);
    void publish_ptt(const std::string& radio_id, bool transmitting);
    void publish_fault(const std::string& radio_id, const common::CommandResult& result);

    void set_listener(Listener listener);

    void stop();

private:
    dts::common::telemetry::RingBuffer ring_buffer_;
    dts::common::telemetry::EventBus event_bus_;
    std::mutex listener_mutex_;
    Listener listener_;

    void publish(const std::string& tag, nlohmann::json payload);
};

}  // namespace riglink::telemetry
