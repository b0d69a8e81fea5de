/**
 * SessionServer — Listens for incoming relay clients.
 *
 * Uses standalone ASIO for async I/O. The acceptor lives on its own strand
 * so `stop()` can be called from a signal handler on any pool thread.
 */

#include "network/session_server.h"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

SessionServer::SessionServer(asio::io_context& io,
                             const std::string& bind_address,
                             uint16_t port,
                             std::size_t max_frame_bytes,
                             std::size_t max_outbox_bytes)
    : io_(io),
      acceptor_(asio::make_strand(io),
                asio::ip::tcp::endpoint(asio::ip::make_address(bind_address), port)),
      port_(acceptor_.local_endpoint().port()),
      max_frame_bytes_(max_frame_bytes),
      max_outbox_bytes_(max_outbox_bytes) {}

void SessionServer::start() {
    spdlog::info("Relay listening on {}:{}", acceptor_.local_endpoint().address().to_string(),
                 port_);
    asio::dispatch(acceptor_.get_executor(), [this] { do_accept(); });
}

void SessionServer::stop() {
    asio::dispatch(acceptor_.get_executor(), [this] {
        asio::error_code ignored;
        acceptor_.close(ignored);
    });

    std::vector<std::shared_ptr<ClientSession>> live;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& entry : sessions_) {
            if (auto session = entry.second.lock()) {
                live.push_back(std::move(session));
            }
        }
    }
    spdlog::info("Closing {} client session(s)", live.size());
    for (const auto& session : live) {
        session->close();
    }
}

void SessionServer::set_on_open(OpenCallback cb) { on_open_ = std::move(cb); }
void SessionServer::set_on_message(MessageCallback cb) { on_message_ = std::move(cb); }
void SessionServer::set_on_close(CloseCallback cb) { on_close_ = std::move(cb); }

std::size_t SessionServer::live_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void SessionServer::do_accept() {
    acceptor_.async_accept(
        asio::make_strand(io_),
        [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (ec) {
                spdlog::error("Accept failed: {}", ec.message());
            } else {
                auto session = std::make_shared<ClientSession>(std::move(socket), max_frame_bytes_,
                                                               max_outbox_bytes_);
                {
                    std::lock_guard<std::mutex> lock(sessions_mutex_);
                    sessions_[session->id()] = session;
                }
                if (on_open_) {
                    on_open_(session);
                }
                session->start(on_message_, [this](const ConnectionPtr& connection) {
                    forget(connection->id());
                    if (on_close_) {
                        on_close_(connection);
                    }
                });
            }
            do_accept();
        });
}

void SessionServer::forget(std::uint64_t session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session_id);
}
