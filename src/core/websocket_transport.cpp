/**
 * @file websocket_transport.cpp
 * @brief WebSocketTransport 实现
 */

#include "core/websocket_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http/field.hpp>
#include <openssl/ssl.h>

#include "base/logger.hpp"

namespace ironlink {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

template<class Stream>
void close_socket(Stream& ws) {
    beast::error_code ignored;
    beast::get_lowest_layer(ws).socket().close(ignored);
}

} // namespace

WebSocketTransport::WebSocketTransport(TransportOptions options)
    : options_(std::move(options)),
      ssl_ctx_(ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(options_.verify_peer ? ssl::verify_peer : ssl::verify_none);
}

WebSocketTransport::~WebSocketTransport() {
    close();
    if (io_thread_.joinable()) {
        LOG_ERROR() << "[WebSocket] Transport destroyed on its own I/O thread";
        io_thread_.detach();
    }
}

template<class F>
void WebSocketTransport::with_stream(F&& f) {
    if (tls_ws_) {
        f(*tls_ws_);
    } else if (plain_ws_) {
        f(*plain_ws_);
    }
}

template<class Op>
beast::error_code WebSocketTransport::run_step(Op&& op) {
    beast::error_code result = net::error::would_block;
    bool done = false;
    op([&result, &done](beast::error_code ec, auto&&...) {
        result = ec;
        done = true;
    });
    // 只运行到本步完成为止，握手后挂起的定时器留给 I/O 线程
    ioc_.restart();
    while (!done && ioc_.run_one() > 0) {
    }
    return result;
}

bool WebSocketTransport::open(const Endpoint& endpoint, MessageHandler on_message, CloseHandler on_close) {
    if (opened_.exchange(true)) {
        LOG_ERROR() << "[WebSocket] open() called twice on the same transport";
        return false;
    }
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);

    bool ok = false;
    try {
        ok = handshake(endpoint);
    } catch (const std::exception& e) {
        LOG_WARN() << "[WebSocket] Connect to " << endpoint.url << " failed: " << e.what();
        ok = false;
    }
    if (!ok) {
        with_stream([](auto& ws) { close_socket(ws); });
        return false;
    }

    open_ = true;
    LOG() << "[WebSocket] Connected to " << endpoint.url;

    ioc_.restart();
    do_read();
    io_thread_ = std::thread([this] {
        ioc_.run();
        LOG_DEBUG() << "[WebSocket] I/O thread exited";
    });
    return true;
}

bool WebSocketTransport::handshake(const Endpoint& endpoint) {
    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        LOG_WARN() << "[WebSocket] Resolve " << endpoint.host << " failed: " << ec.message();
        return false;
    }

    if (endpoint.tls) {
        tls_ws_ = std::make_unique<TlsStream>(ioc_, ssl_ctx_);
        // SNI
        if (!SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(), endpoint.host.c_str())) {
            LOG_WARN() << "[WebSocket] Failed to set SNI host name " << endpoint.host;
            return false;
        }
        if (options_.verify_peer) {
            tls_ws_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));
        }
    } else {
        plain_ws_ = std::make_unique<PlainStream>(ioc_);
    }

    // TCP 连接
    with_stream([&](auto& ws) {
        auto& lowest = beast::get_lowest_layer(ws);
        lowest.expires_after(options_.connect_timeout);
        ec = run_step([&](auto handler) { lowest.async_connect(results, handler); });
    });
    if (ec) {
        LOG_WARN() << "[WebSocket] TCP connect to " << endpoint.host << ":" << endpoint.port
                   << " failed: " << ec.message();
        return false;
    }

    // TLS 握手
    if (tls_ws_) {
        beast::get_lowest_layer(*tls_ws_).expires_after(options_.connect_timeout);
        ec = run_step([&](auto handler) {
            tls_ws_->next_layer().async_handshake(ssl::stream_base::client, handler);
        });
        if (ec) {
            LOG_WARN() << "[WebSocket] TLS handshake with " << endpoint.host << " failed: " << ec.message();
            return false;
        }
    }

    // WebSocket 握手，之后由 WebSocket 层接管超时与 ping 保活
    with_stream([&](auto& ws) {
        beast::get_lowest_layer(ws).expires_never();

        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = options_.connect_timeout;
        opt.idle_timeout = options_.idle_timeout;
        opt.keep_alive_pings = true;
        ws.set_option(opt);

        const std::string user_agent = options_.user_agent;
        ws.set_option(websocket::stream_base::decorator(
            [user_agent](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, user_agent);
            }));
        ws.read_message_max(options_.max_frame_size);
        ws.text(true);

        ec = run_step([&](auto handler) {
            ws.async_handshake(endpoint.host_header(), endpoint.target, handler);
        });
    });
    if (ec) {
        LOG_WARN() << "[WebSocket] WebSocket handshake with " << endpoint.url << " failed: " << ec.message();
        return false;
    }
    return true;
}

bool WebSocketTransport::send(const std::string& frame) {
    if (!open_ || closing_) {
        return false;
    }
    net::post(ioc_, [this, frame] {
        if (!open_) return;
        write_queue_.push_back(frame);
        if (write_queue_.size() == 1) {
            do_write();
        }
    });
    return true;
}

void WebSocketTransport::do_write() {
    with_stream([this](auto& ws) {
        ws.async_write(net::buffer(write_queue_.front()),
            [this](beast::error_code ec, std::size_t) {
                if (ec) {
                    on_failure("write failed: " + ec.message());
                    return;
                }
                write_queue_.pop_front();
                if (!write_queue_.empty()) {
                    do_write();
                }
            });
    });
}

void WebSocketTransport::do_read() {
    with_stream([this](auto& ws) {
        ws.async_read(read_buffer_, [this](beast::error_code ec, std::size_t) { on_read(ec); });
    });
}

void WebSocketTransport::on_read(beast::error_code ec) {
    if (ec) {
        if (ec == websocket::error::closed) {
            on_failure("connection closed by broker");
        } else {
            on_failure(ec.message());
        }
        return;
    }

    std::string frame = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());

    if (on_message_) {
        try {
            on_message_(frame);
        } catch (const std::exception& e) {
            LOG_ERROR() << "[WebSocket] Message handler threw: " << e.what();
        }
    }
    do_read();
}

void WebSocketTransport::on_failure(const std::string& reason) {
    open_ = false;
    if (close_timer_) {
        close_timer_->cancel();
    }
    with_stream([](auto& ws) { close_socket(ws); });

    if (closing_) {
        return;
    }
    if (close_notified_.exchange(true)) {
        return;
    }
    LOG_WARN() << "[WebSocket] Connection lost: " << reason;
    if (on_close_) {
        on_close_(reason);
    }
}

void WebSocketTransport::close() {
    const bool first = !closing_.exchange(true);
    const bool was_open = open_.exchange(false);

    if (first && was_open) {
        net::post(ioc_, [this] {
            close_timer_ = std::make_unique<net::steady_timer>(ioc_, options_.close_timeout);
            close_timer_->async_wait([this](beast::error_code ec) {
                if (ec) return;  // 已取消
                LOG_DEBUG() << "[WebSocket] Close handshake timed out, dropping socket";
                with_stream([](auto& ws) { close_socket(ws); });
            });
            with_stream([this](auto& ws) {
                ws.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
                    if (ec) {
                        LOG_DEBUG() << "[WebSocket] Close handshake: " << ec.message();
                    }
                    close_timer_->cancel();
                    with_stream([](auto& s) { close_socket(s); });
                });
            });
        });
    }

    if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
        io_thread_.join();
    }
}

} // namespace ironlink
