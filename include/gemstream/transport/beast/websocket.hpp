#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <memory>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "gemstream/transport/concepts.hpp"
#include "gemstream/transport/error.hpp"


/*
================================================================================
WebSocket Transport (Boost.Beast over TLS)
================================================================================

Single-connection transport primitive:
  • Resolve, TCP connect, TLS handshake (SNI + peer verification against the
    system CA store), WebSocket upgrade
  • One receive thread per connection delivers frames to the message callback
  • Close is signaled exactly once per connection, whichever side closes
  • No retries, no reconnection logic; recovery lives in stream::Client

connect() may be called again after close(); each connection gets a fresh
stream object.
================================================================================
*/


namespace gemstream {
namespace transport {
namespace beast {

class WebSocket {
    using tcp        = boost::asio::ip::tcp;
    using tls_stream = boost::asio::ssl::stream<tcp::socket>;
    using ws_stream  = boost::beast::websocket::stream<tls_stream>;

public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    bool connect(const std::string& host, const std::string& port, const std::string& path) noexcept;

    void close() noexcept;

    void set_message_callback(MessageCallback cb) { on_message_ = std::move(cb); }
    void set_close_callback(CloseCallback cb)     { on_close_   = std::move(cb); }
    void set_error_callback(ErrorCallback cb)     { on_error_   = std::move(cb); }

    [[nodiscard]]
    Error last_error() const noexcept { return last_error_.load(std::memory_order_acquire); }

private:
    void receive_loop_() noexcept;
    void signal_close_() noexcept;
    void fail_(Error err) noexcept;

private:
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::unique_ptr<ws_stream> ws_;

    std::thread recv_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{true};
    std::atomic<Error> last_error_{Error::None};

    MessageCallback on_message_;
    CloseCallback   on_close_;
    ErrorCallback   on_error_;
};
// Check that WebSocket conforms to the transport::WebSocketConcept concept
static_assert(gemstream::transport::WebSocketConcept<WebSocket>);

} // namespace beast
} // namespace transport
} // namespace gemstream
