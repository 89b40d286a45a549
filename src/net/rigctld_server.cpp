#include "riglink/net/rigctld_server.hpp"

#include "riglink/command/orchestrator.hpp"
#include "riglink/config/types.hpp"
#include "riglink/net/rigctld_command.hpp"
#include "riglink/net/rigctld_handler.hpp"
#include "riglink/net/rigctld_response.hpp"

#include <dts/common/core/logging.hpp>

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>

#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace riglink::net {

namespace {

constexpr std::size_t kMaxLineLength = 4096;

std::string describe(const asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return remote.address().to_string() + ":" + std::to_string(remote.port());
}

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::ip::tcp::socket socket, command::Orchestrator& orchestrator)
        : socket_{std::move(socket)},
          peer_{describe(socket_)},
          buffer_{kMaxLineLength},
          handler_{orchestrator, "rigctld:" + peer_} {}

    void start() {
        dts::common::core::getLogger().info("[RigctldServer] Client connected: " + peer_);
        read_line();
    }

    void close() {
        if (!socket_.is_open()) {
            return;
        }
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        dts::common::core::getLogger().info("[RigctldServer] Client disconnected: " + peer_);
    }

private:
    asio::ip::tcp::socket socket_;
    std::string peer_;
    asio::streambuf buffer_;
    RigctldHandler handler_;
    bool extended_{false};
    bool closing_{false};

    void read_line() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, '\n', [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                if (ec == asio::error::not_found) {
                    dts::common::core::getLogger().info("[RigctldServer] " + self->peer_ + " sent an over-long line");
                }
                self->close();
                return;
            }
            std::istream stream(&self->buffer_);
            std::string line;
            std::getline(stream, line);
            self->dispatch(line);
        });
    }

    void dispatch(const std::string& line) {
        std::string reply;
        try {
            const auto command = RigctldParser::parse(line);
            if (command.verb == RigctldVerb::SetExtResponse) {
                extended_ = RigctldParser::parse_integer(command.args[0], "set_ext_response") != 0;
            }
            if (command.verb == RigctldVerb::Quit) {
                closing_ = true;
            }
            reply = handler_.handle(command).format(command.extended || extended_);
        } catch (const RigctldParseError& e) {
            dts::common::core::getLogger().info("[RigctldServer] " + peer_ + " rejected command: " + e.what());
            reply = RigctldResponse::status(RigctldVerb::GetFreq, ReturnCode::InvalidParameter).format(false);
        }
        write(std::move(reply));
    }

    void write(std::string reply) {
        auto self = shared_from_this();
        auto data = std::make_shared<std::string>(std::move(reply));
        asio::async_write(socket_, asio::buffer(*data), [self, data](const asio::error_code& ec, std::size_t) {
            if (ec || self->closing_) {
                self->close();
                return;
            }
            self->read_line();
        });
    }
};

}  // namespace

class RigctldServer::Impl {
public:
    Impl(asio::io_context& io, const config::NetworkConfig& network, command::Orchestrator& orchestrator)
        : endpoint_{asio::ip::make_address(network.bind_address), network.rigctld_port},
          orchestrator_{orchestrator},
          acceptor_{io} {}

    void start() {
        acceptor_.open(endpoint_.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint_);
        acceptor_.listen();
        dts::common::core::getLogger().info("[RigctldServer] Listening on " + endpoint_.address().to_string() + ":" +
                                            std::to_string(port()));
        accept();
    }

    void stop() {
        if (acceptor_.is_open()) {
            asio::error_code ec;
            acceptor_.close(ec);
        }
        for (auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                session->close();
            }
        }
        sessions_.clear();
        dts::common::core::getLogger().info("[RigctldServer] Stopped");
    }

    std::uint16_t port() const {
        asio::error_code ec;
        const auto local = acceptor_.local_endpoint(ec);
        return ec ? endpoint_.port() : local.port();
    }

private:
    asio::ip::tcp::endpoint endpoint_;
    command::Orchestrator& orchestrator_;
    asio::ip::tcp::acceptor acceptor_;
    std::vector<std::weak_ptr<Session>> sessions_;

    void accept() {
        acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    dts::common::core::getLogger().info("[RigctldServer] Accept failed: " + ec.message());
                    accept();
                }
                return;
            }
            auto session = std::make_shared<Session>(std::move(socket), orchestrator_);
            prune();
            sessions_.push_back(session);
            session->start();
            accept();
        });
    }

    void prune() {
        std::erase_if(sessions_, [](const std::weak_ptr<Session>& weak) { return weak.expired(); });
    }
};

RigctldServer::RigctldServer(asio::io_context& io,
                             const config::NetworkConfig& network,
                             command::Orchestrator& orchestrator)
    : impl_{std::make_unique<Impl>(io, network, orchestrator)} {}

RigctldServer::~RigctldServer() = default;

void RigctldServer::start() {
    impl_->start();
}

void RigctldServer::stop() {
    impl_->stop();
}

std::uint16_t RigctldServer::port() const {
    return impl_->port();
}

}  // namespace riglink::net
