#include "network/BybitPublicWebSocketClient.h"

#include "common/Logger.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {
long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// stop() 이후 소켓이 닫히기까지 걸리는 최대 시간
constexpr auto kIoSlice = std::chrono::milliseconds(200);
constexpr auto kConnectTimeout = std::chrono::seconds(15);
}

namespace spotpilot {
namespace network {

BybitPublicWebSocketClient::BybitPublicWebSocketClient(PushEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

BybitPublicWebSocketClient::~BybitPublicWebSocketClient() {
    stop();
}

std::string BybitPublicWebSocketClient::buildSubscribeMessage(const std::vector<std::string>& topics) {
    nlohmann::json subscribe;
    subscribe["op"] = "subscribe";
    subscribe["args"] = topics;
    return subscribe.dump();
}

bool BybitPublicWebSocketClient::start(TextHandler handler) {
    if (running_.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        message_handler_ = std::move(handler);
    }

    running_ = true;
    worker_thread_ = std::thread(&BybitPublicWebSocketClient::runLoop, this);
    return true;
}

void BybitPublicWebSocketClient::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        running_ = false;
    }
    stop_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    connected_ = false;
}

bool BybitPublicWebSocketClient::waitBeforeReconnect(std::chrono::seconds delay) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait_for(lock, delay, [this]() { return !running_.load(); });
    return running_.load();
}

void BybitPublicWebSocketClient::runLoop() {
    int reconnect_attempt = 0;

    while (running_.load()) {
        const auto connected_since = std::chrono::steady_clock::now();
        try {
            connectAndReadLoop();
            reconnect_attempt = 0;
        } catch (const std::exception& e) {
            connected_ = false;
            if (!running_.load()) {
                break;
            }

            const auto connected_for = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - connected_since
            ).count();
            if (connected_for >= 60) {
                reconnect_attempt = 0;
            } else {
                ++reconnect_attempt;
            }
            const int backoff_seconds = std::min(30, std::max(1, reconnect_attempt * 2));
            LOG_WARN("public WS {} disconnected: {} (retry in {}s)",
                     endpoint_.host, e.what(), backoff_seconds);
            if (!waitBeforeReconnect(std::chrono::seconds(backoff_seconds))) {
                break;
            }
        }
    }
}

void BybitPublicWebSocketClient::connectAndReadLoop() {
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    net::io_context ioc;
    ssl::context ssl_ctx(ssl::context::tlsv12_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);

    websocket::stream<beast::ssl_stream<tcp::socket>> ws(ioc, ssl_ctx);
    ws.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(15),   // handshake timeout
        std::chrono::seconds(60),   // idle timeout
        true                        // send ping automatically
    });

    bool op_done = false;
    boost::system::error_code op_ec;

    // 소켓을 닫아 대기 중인 비동기 작업을 operation_aborted 로 끝낸다
    auto abortSocket = [&ws]() {
        boost::system::error_code ignored;
        beast::get_lowest_layer(ws).close(ignored);
    };

    auto pump = [&ioc]() {
        if (ioc.stopped()) {
            ioc.restart();
        }
        ioc.run_for(kIoSlice);
    };

    // 연결 단계: stop() 또는 deadline 이면 소켓을 닫고 완료 핸들러를 기다림
    auto awaitOp = [&](const char* what) {
        const auto deadline = std::chrono::steady_clock::now() + kConnectTimeout;
        bool aborted = false;
        while (!op_done) {
            if (!aborted && (!running_.load() || std::chrono::steady_clock::now() >= deadline)) {
                abortSocket();
                aborted = true;
            }
            pump();
        }
        op_done = false;
        if (op_ec) {
            throw std::runtime_error(std::string(what) + " failed: " + op_ec.message());
        }
        if (aborted) {
            throw std::runtime_error(std::string(what) + " aborted");
        }
    };

    const std::string& host = endpoint_.host;

    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(host, endpoint_.port);

    net::async_connect(beast::get_lowest_layer(ws), results.begin(), results.end(),
        [&](const boost::system::error_code& ec, tcp::resolver::iterator) {
            op_ec = ec;
            op_done = true;
        });
    awaitOp("connect");

    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
        throw std::runtime_error("public WS SNI setup failed");
    }
    ws.next_layer().set_verify_callback(ssl::host_name_verification(host));
    ws.next_layer().async_handshake(ssl::stream_base::client,
        [&](const boost::system::error_code& ec) {
            op_ec = ec;
            op_done = true;
        });
    awaitOp("TLS handshake");

    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "SpotPilot/1.0");
        }
    ));

    ws.async_handshake(host, endpoint_.target,
        [&](const boost::system::error_code& ec) {
            op_ec = ec;
            op_done = true;
        });
    awaitOp("WS handshake");

    const std::string subscribe = buildSubscribeMessage(endpoint_.topics);
    ws.async_write(net::buffer(subscribe),
        [&](const boost::system::error_code& ec, std::size_t) {
            op_ec = ec;
            op_done = true;
        });
    awaitOp("subscribe");

    connected_ = true;
    last_message_time_ms_ = nowMs();
    LOG_INFO("public WS connected: {}{} topics={}",
             host, endpoint_.target, nlohmann::json(endpoint_.topics).dump());

    ws.control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong || kind == websocket::frame_type::ping) {
            last_message_time_ms_ = nowMs();
        }
    });

    // 애플리케이션 레벨 heartbeat
    const std::string ping_payload = R"({"op":"ping"})";
    bool ping_in_flight = false;
    auto last_ping = std::chrono::steady_clock::now();

    beast::flat_buffer buffer;

    while (running_.load()) {
        bool read_done = false;
        boost::system::error_code read_ec;
        ws.async_read(buffer, [&](const boost::system::error_code& ec, std::size_t) {
            read_ec = ec;
            read_done = true;
        });

        while (!read_done && running_.load()) {
            pump();

            const auto now = std::chrono::steady_clock::now();
            if (!ping_in_flight && now - last_ping >= endpoint_.ping_interval) {
                ping_in_flight = true;
                last_ping = now;
                ws.async_write(net::buffer(ping_payload),
                    [&](const boost::system::error_code& ec, std::size_t) {
                        ping_in_flight = false;
                        if (ec && ec != net::error::operation_aborted) {
                            LOG_WARN("public WS ping failed: {}", ec.message());
                        }
                    });
            }
        }

        if (!read_done) {
            // stop() 요청: 수신 중인 read 를 끊는다
            abortSocket();
            while (!read_done || ping_in_flight) {
                pump();
            }
            break;
        }

        if (read_ec) {
            abortSocket();
            while (ping_in_flight) {
                pump();
            }
            if (read_ec == beast::error::timeout) {
                throw std::runtime_error("public WS timed out");
            }
            if (read_ec == websocket::error::closed) {
                throw std::runtime_error("public WS closed by server");
            }
            throw std::runtime_error("public WS read failed: " + read_ec.message());
        }

        const std::string payload = beast::buffers_to_string(buffer.cdata());
        buffer.consume(buffer.size());
        last_message_time_ms_ = nowMs();
        dispatchMessage(payload);
    }

    abortSocket();
    while (ping_in_flight) {
        pump();
    }
    connected_ = false;
    LOG_INFO("public WS stopped: {}", host);
}

void BybitPublicWebSocketClient::dispatchMessage(const std::string& payload) {
    TextHandler handler_copy;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_copy = message_handler_;
    }
    if (!handler_copy) {
        return;
    }

    try {
        handler_copy(payload);
    } catch (const std::exception& e) {
        LOG_WARN("public WS handler failed: {}", e.what());
    }
}

} // namespace network
} // namespace spotpilot
