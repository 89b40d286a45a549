#include "riglink/telemetry/telemetry_hub.hpp"

#include <utility>

namespace riglink::telemetry {

TelemetryHub::TelemetryHub(asio::io_context& io, const config::TelemetryConfig& config)
    : ring_buffer_(config.event_buffer_size, config.event_retention),
      event_bus_(io, ring_buffer_) {}

void TelemetryHub::publish_ready(const std::string& service_id, std::size_t radio_count) {
    nlohmann::json payload = {
        {"serviceId", service_id},
        {"radios", radio_count},
        {"status", "ready"}
    };
    publish(tags::READY, std::move(payload));
}

void TelemetryHub::publish_radio_state(const std::string& radio_id,
                                       common::SessionState state,
                                       const std::string& detail) {
    nlohmann::json payload = {
        {"radioId", radio_id},
        {"state", common::to_string(state)}
    };
    if (!detail.empty()) {
        payload["detail"] = detail;
    }
    publish(tags::RADIO_STATE, std::move(payload));
}

void TelemetryHub::publish_frequency(const std::string& radio_id, common::Vfo vfo, std::uint64_t hz) {
    nlohmann::json payload = {
        {"radioId", radio_id},
        {"vfo", common::to_string(vfo)},
        {"frequencyHz", hz}
    };
    publish(tags::FREQUENCY, std::move(payload));
}

void TelemetryHub::publish_ptt(const std::string& radio_id, bool transmitting) {
    nlohmann::json payload = {
        {"radioId", radio_id},
        {"transmitting", transmitting}
    };
    publish(tags::PTT, std::move(payload));
}

void TelemetryHub::publish_fault(const std::string& radio_id, const common::CommandResult& result) {
    nlohmann::json payload = {
        {"radioId", radio_id},
        {"code", common::to_string(result.code)},
        {"message", result.message}
    };
    publish(tags::FAULT, std::move(payload));
}

void TelemetryHub::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void TelemetryHub::stop() {
    event_bus_.stop();
}

void TelemetryHub::publish(const std::string& tag, nlohmann::json payload) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(tag, payload);
    }
    event_bus_.publish(tag, std::move(payload));
}

}  // namespace riglink::telemetry
