/**
 * HealthApi — HTTP/1.1 status endpoint on its own port.
 *
 *   GET /health   — {"status":"ok","users":N,"timestamp":ms}
 *   anything else — 404 Not Found
 *
 * One request per connection; the socket is closed after the response, or
 * when the request timeout expires first.
 */

#include "api/health_api.h"

#include <istream>
#include <memory>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMaxRequestBytes = 8 * 1024;

struct HttpExchange {
    explicit HttpExchange(asio::ip::tcp::socket s)
        : socket(std::move(s)), deadline(socket.get_executor()), request(kMaxRequestBytes) {}

    void close() {
        asio::error_code ignored;
        deadline.cancel();
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    asio::ip::tcp::socket socket;
    asio::steady_timer deadline;
    asio::streambuf request;
    std::string response;
};

std::string http_response(const char* status_line, const char* content_type,
                          const std::string& body) {
    std::ostringstream out;
    out << "HTTP/1.1 " << status_line << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return out.str();
}

}  // namespace

HealthApi::HealthApi(asio::io_context& io, const std::string& bind_address, uint16_t port,
                     StatusProvider status, std::chrono::steady_clock::duration request_timeout)
    : acceptor_(asio::make_strand(io),
                asio::ip::tcp::endpoint(asio::ip::make_address(bind_address), port)),
      port_(acceptor_.local_endpoint().port()),
      status_(std::move(status)),
      request_timeout_(request_timeout) {}

void HealthApi::start() {
    spdlog::info("Health check: http://{}:{}/health",
                 acceptor_.local_endpoint().address().to_string(), port_);
    asio::dispatch(acceptor_.get_executor(), [this] { do_accept(); });
}

void HealthApi::stop() {
    asio::dispatch(acceptor_.get_executor(), [this] {
        asio::error_code ignored;
        acceptor_.close(ignored);
    });
}

std::string HealthApi::respond(const std::string& request_line) const {
    std::istringstream in(request_line);
    std::string method;
    std::string target;
    in >> method >> target;

    if (target == "/health") {
        return http_response("200 OK", "application/json", status_().dump());
    }
    return http_response("404 Not Found", "text/plain", "Not Found");
}

void HealthApi::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            spdlog::error("Health accept failed: {}", ec.message());
        } else {
            handle_request(std::move(socket));
        }
        do_accept();
    });
}

void HealthApi::handle_request(asio::ip::tcp::socket socket) {
    auto exchange = std::make_shared<HttpExchange>(std::move(socket));

    // Covers both the request read and the response write.
    exchange->deadline.expires_after(request_timeout_);
    exchange->deadline.async_wait([exchange](const asio::error_code& ec) {
        if (!ec) {
            spdlog::debug("Health request timed out, closing");
            exchange->close();
        }
    });

    asio::async_read_until(
        exchange->socket, exchange->request, "\r\n\r\n",
        [this, exchange](const asio::error_code& ec, std::size_t) {
            if (ec) {
                exchange->close();
                return;
            }
            std::istream stream(&exchange->request);
            std::string request_line;
            std::getline(stream, request_line);
            exchange->response = respond(request_line);

            asio::async_write(exchange->socket, asio::buffer(exchange->response),
                              [exchange](const asio::error_code&, std::size_t) {
                                  exchange->close();
                              });
        });
}
