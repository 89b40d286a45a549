#pragma once

#include <cstdint>
#include <memory>

namespace asio {
class io_context;
}

namespace riglink::config {
struct NetworkConfig;
}

namespace riglink::command {
class Orchestrator;
}

namespace riglink::net {

// Hamlib rigctld-compatible TCP listener. Each client gets its own line
// session; commands run against the orchestrator's active radio.
class RigctldServer {
public:
    RigctldServer(asio::io_context& io,
                  const config::NetworkConfig& network,
                  command::Orchestrator& orchestrator);
    ~RigctldServer();

    RigctldServer(const RigctldServer&) = delete;
    RigctldServer& operator=(const RigctldServer&) = delete;
    RigctldServer(RigctldServer&&) noexcept = delete;
    RigctldServer& operator=(RigctldServer&&) noexcept = delete;

    // Throws std::system_error if the endpoint cannot be bound.
    void start();
    void stop();

    // Bound port; differs from the configured one when that was 0.
    std::uint16_t port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace riglink::net
