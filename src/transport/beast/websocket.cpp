#include "gemstream/transport/beast/websocket.hpp"

#include <utility>

#include <boost/asio/connect.hpp>
#include <openssl/ssl.h>

#include "lcr/log/logger.hpp"


namespace gemstream {
namespace transport {
namespace beast {

namespace asio  = boost::asio;
namespace ssl   = boost::asio::ssl;
namespace bbeast = boost::beast;
namespace bws   = boost::beast::websocket;

WebSocket::WebSocket()
    : ssl_ctx_(ssl::context::tls_client)
{
    ssl_ctx_.set_default_verify_paths();
}

WebSocket::~WebSocket() {
    close();
}

bool WebSocket::connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
    if (running_.load(std::memory_order_acquire)) {
        GS_ERROR("[WS] connect() called on an open WebSocket");
        last_error_.store(Error::InvalidState, std::memory_order_release);
        return false;
    }
    // Previous receive thread (remote close) must be gone before reuse
    if (recv_thread_.joinable()) {
        recv_thread_.join();
    }

    last_error_.store(Error::None, std::memory_order_release);
    bbeast::error_code ec;

    try {
        ws_ = std::make_unique<ws_stream>(ioc_, ssl_ctx_);
    } catch (const std::exception& e) {
        GS_ERROR("[WS] Failed to create stream: " << e.what());
        last_error_.store(Error::TransportFailure, std::memory_order_release);
        return false;
    }

    // 1) Resolve + TCP connect
    tcp::resolver resolver(ioc_);
    auto const results = resolver.resolve(host, port, ec);
    if (ec) {
        GS_ERROR("[WS] Resolve failed for " << host << ":" << port << " (" << ec.message() << ")");
        last_error_.store(Error::ConnectionFailed, std::memory_order_release);
        ws_.reset();
        return false;
    }
    asio::connect(bbeast::get_lowest_layer(*ws_), results, ec);
    if (ec) {
        GS_ERROR("[WS] TCP connect failed for " << host << ":" << port << " (" << ec.message() << ")");
        last_error_.store(Error::ConnectionFailed, std::memory_order_release);
        ws_.reset();
        return false;
    }

    // 2) TLS handshake (SNI must be set before the handshake)
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host.c_str())) {
        GS_ERROR("[WS] Failed to set SNI host name '" << host << "'");
        last_error_.store(Error::HandshakeFailed, std::memory_order_release);
        ws_.reset();
        return false;
    }
    ws_->next_layer().set_verify_mode(ssl::verify_peer);
    ws_->next_layer().set_verify_callback(ssl::host_name_verification(host));
    ws_->next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        GS_ERROR("[WS] TLS handshake failed (" << ec.message() << ")");
        last_error_.store(Error::HandshakeFailed, std::memory_order_release);
        ws_.reset();
        return false;
    }

    // 3) WebSocket upgrade
    ws_->set_option(bws::stream_base::decorator(
        [](bws::request_type& req) {
            req.set(bbeast::http::field::user_agent, "gemstream/1.0");
        }));
    ws_->handshake(host, path, ec);
    if (ec) {
        GS_ERROR("[WS] WebSocket handshake failed (" << ec.message() << ")");
        last_error_.store(Error::HandshakeFailed, std::memory_order_release);
        ws_.reset();
        return false;
    }

    GS_DEBUG("[WS] Connected to " << host << ":" << port << path);
    closed_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    recv_thread_ = std::thread(&WebSocket::receive_loop_, this);
    return true;
}

void WebSocket::close() noexcept {
    // Stop the receive loop (idempotent)
    bool was_running = running_.exchange(false, std::memory_order_acq_rel);
    if (was_running) {
        last_error_.store(Error::LocalShutdown, std::memory_order_release);
    }
    // Unblock a pending read by shutting the socket down
    if (ws_) {
        bbeast::error_code ec;
        auto& sock = bbeast::get_lowest_layer(*ws_);
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }
    bool joined = false;
    if (recv_thread_.joinable()) {
        if (recv_thread_.get_id() == std::this_thread::get_id()) {
            // close() issued from a callback: the loop exits on its own
            recv_thread_.detach();
        } else {
            recv_thread_.join();
            joined = true;
        }
    }
    signal_close_();
    if (joined) {
        ws_.reset();
    }
    GS_TRACE("[WS] WebSocket closed.");
}

void WebSocket::receive_loop_() noexcept {
    bbeast::flat_buffer buffer;
    while (running_.load(std::memory_order_acquire)) {
        bbeast::error_code ec;
        ws_->read(buffer, ec);
        if (ec) {
            if (!running_.load(std::memory_order_acquire)) {
                // Local close() interrupted the read
                break;
            }
            if (ec == bws::error::closed) {
                GS_INFO("[WS] Remote endpoint closed the connection.");
                last_error_.store(Error::RemoteClosed, std::memory_order_release);
            } else {
                GS_WARN("[WS] Read failed (" << ec.message() << ")");
                fail_(Error::TransportFailure);
            }
            running_.store(false, std::memory_order_release);
            signal_close_();
            break;
        }
        std::string msg = bbeast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        if (on_message_) {
            on_message_(msg);
        }
    }
}

void WebSocket::fail_(Error err) noexcept {
    last_error_.store(err, std::memory_order_release);
    if (on_error_) {
        on_error_(err);
    }
}

void WebSocket::signal_close_() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (on_close_) {
        on_close_();
    }
}

} // namespace beast
} // namespace transport
} // namespace gemstream
