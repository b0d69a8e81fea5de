/**
 * ClientSession — asio session reading and writing length-prefixed JSON.
 *
 * Reads a 4-byte header then the body, hands the body to the relay, and
 * loops. Writes are queued and drained one at a time.
 */

#include "network/client_session.h"

#include <utility>

#include <spdlog/spdlog.h>

ClientSession::ClientSession(asio::ip::tcp::socket socket, std::size_t max_frame_bytes,
                             std::size_t max_outbox_bytes)
    : socket_(std::move(socket)),
      max_frame_bytes_(max_frame_bytes),
      max_outbox_bytes_(max_outbox_bytes),
      id_(Connection::next_id()) {
    asio::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown")
                 : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void ClientSession::start(MessageHandler on_message, CloseHandler on_close) {
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
    open_ = true;
    asio::dispatch(socket_.get_executor(), [self = shared_from_this()] { self->read_header(); });
}

bool ClientSession::send(const std::string& frame) {
    if (!open_) {
        return false;
    }
    std::string data = frame_codec::encode(frame);
    if (outbox_bytes_.fetch_add(data.size()) + data.size() > max_outbox_bytes_) {
        outbox_bytes_ -= data.size();
        spdlog::warn("Session {} has more than {} bytes unsent, closing", remote_,
                     max_outbox_bytes_);
        close();
        return false;
    }
    asio::post(socket_.get_executor(),
               [self = shared_from_this(), data = std::move(data)]() mutable {
                   if (self->closed_) {
                       return;
                   }
                   self->outbox_.push_back(std::move(data));
                   if (self->outbox_.size() == 1) {
                       self->write_next();
                   }
               });
    return true;
}

void ClientSession::close() {
    open_ = false;
    asio::post(socket_.get_executor(),
               [self = shared_from_this()] { self->shutdown(asio::error_code()); });
}

void ClientSession::read_header() {
    asio::async_read(socket_, asio::buffer(header_),
                     [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
                         if (ec) {
                             self->shutdown(ec);
                             return;
                         }
                         const std::uint32_t length = frame_codec::decode_header(self->header_);
                         if (length > self->max_frame_bytes_) {
                             spdlog::warn("Session {} sent a {} byte frame (limit {}), closing",
                                          self->remote_, length, self->max_frame_bytes_);
                             self->shutdown(asio::error::message_size);
                             return;
                         }
                         // An empty frame still goes to the relay, which answers it.
                         self->read_body(length);
                     });
}

void ClientSession::read_body(std::uint32_t length) {
    body_.resize(length);
    asio::async_read(socket_, asio::buffer(body_),
                     [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
                         if (ec) {
                             self->shutdown(ec);
                             return;
                         }
                         if (self->on_message_) {
                             self->on_message_(self, self->body_);
                         }
                         if (!self->closed_) {
                             self->read_header();
                         }
                     });
}

void ClientSession::write_next() {
    asio::async_write(socket_, asio::buffer(outbox_.front()),
                      [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
                          if (ec) {
                              self->shutdown(ec);
                              return;
                          }
                          self->outbox_bytes_ -= self->outbox_.front().size();
                          self->outbox_.pop_front();
                          if (!self->outbox_.empty()) {
                              self->write_next();
                          }
                      });
}

void ClientSession::shutdown(const asio::error_code& ec) {
    if (closed_) {
        return;
    }
    closed_ = true;
    open_ = false;

    if (ec && ec != asio::error::eof && ec != asio::error::operation_aborted) {
        spdlog::warn("Session {} transport error: {}", remote_, ec.message());
    }

    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    auto on_close = std::move(on_close_);
    on_close_ = nullptr;
    on_message_ = nullptr;
    if (on_close) {
        on_close(shared_from_this());
    }
}
