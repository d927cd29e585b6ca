#include "podbridge/server/api_router.hpp"
#include "podbridge/server/app.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

using nlohmann::json;
using podbridge::server::ApiRouter;
using podbridge::server::HttpRequest;
using podbridge::server::HttpResponse;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace bt = podbridge::bluetooth;

namespace {

class RecordingSubscriber : public bt::EventSubscriber {
public:
    void deliver(std::shared_ptr<const std::string> message) override { received.push_back(json::parse(*message)); }
    bool is_open() const override { return true; }

    std::vector<json> received;
};

std::filesystem::path makeTempDir() {
    static std::size_t counter = 0;
    const auto suffix = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count() + counter++);
    const auto dir = std::filesystem::temp_directory_path() / ("podbridge-router-" + suffix);
    std::filesystem::create_directories(dir);
    return dir;
}

podbridge::BridgeConfig makeConfig(const std::filesystem::path& dir) {
    podbridge::BridgeConfig config;
    config.server.host = "127.0.0.1";
    config.server.port = 0;
    config.bluetooth.executable = "/nonexistent/podbridge-control-tool";
    config.bluetooth.auto_start = false;
    config.storage.path = (dir / "devices.json").string();
    return config;
}

template <typename Predicate>
bool runUntil(asio::io_context& io, Predicate done, std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        io.restart();
        io.run_for(std::chrono::milliseconds(10));
    }
    return true;
}

HttpRequest makeRequest(http::verb verb, const std::string& target, const std::string& body = {}) {
    HttpRequest request{verb, target, 11};
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();
    return request;
}

struct RouterFixture {
    RouterFixture()
        : dir(makeTempDir()),
          config(makeConfig(dir)),
          store(config.storage.path),
          controller(io, config, store, broadcaster),
          router(controller, broadcaster) {
        broadcaster.set_snapshot_provider([this] { return controller.snapshot_events(); });
    }

    ~RouterFixture() { std::filesystem::remove_all(dir); }

    HttpResponse call(const HttpRequest& request) {
        std::optional<HttpResponse> response;
        router.handle(request, [&](HttpResponse r) { response = std::move(r); });
        REQUIRE(runUntil(io, [&] { return response.has_value(); }));
        return std::move(*response);
    }

    static json body(const HttpResponse& response) { return json::parse(response.body()); }

    std::filesystem::path dir;
    podbridge::BridgeConfig config;
    asio::io_context io;
    bt::JsonDeviceStore store;
    bt::EventBroadcaster broadcaster;
    bt::BluetoothController controller;
    ApiRouter router;
};

}  // namespace

TEST_CASE("Router serves the read-only views", "[router]") {
    RouterFixture fx;

    const auto health = fx.call(makeRequest(http::verb::get, "/health"));
    CHECK(health.result() == http::status::ok);
    CHECK(health[http::field::content_type] == "application/json");
    const auto health_body = RouterFixture::body(health);
    CHECK(health_body.at("status") == "ok");
    CHECK(health_body.at("bluetooth_connected") == false);
    CHECK(health_body.at("devices_count") == 0);

    const auto devices = RouterFixture::body(fx.call(makeRequest(http::verb::get, "/api/devices/?fresh=1")));
    CHECK(devices.at("success") == true);
    CHECK(devices.at("devices").empty());
    CHECK(devices.at("device_count") == 0);

    const auto status = RouterFixture::body(fx.call(makeRequest(http::verb::get, "/api/status")));
    CHECK(status.at("success") == true);
    CHECK(status.at("state") == "uninitialized");
    CHECK(status.at("device").is_null());
}

TEST_CASE("Router answers unknown routes and preflight requests", "[router]") {
    RouterFixture fx;

    const auto missing = fx.call(makeRequest(http::verb::get, "/api/nothing"));
    CHECK(missing.result() == http::status::not_found);
    CHECK(RouterFixture::body(missing).at("error") == "Not found");

    CHECK(fx.call(makeRequest(http::verb::delete_, "/api/devices")).result() == http::status::not_found);
    CHECK(fx.call(makeRequest(http::verb::post, "/api/unknown", "{}")).result() == http::status::not_found);

    const auto preflight = fx.call(makeRequest(http::verb::options, "/api/pair"));
    CHECK(preflight.result() == http::status::no_content);
    CHECK(preflight[http::field::access_control_allow_origin] == "*");
}

TEST_CASE("Router validates request bodies", "[router]") {
    RouterFixture fx;

    struct Case {
        std::string target;
        std::string body;
        std::string error;
    };
    const std::vector<Case> cases = {
        {"/api/pair", "{}", "MAC address required"},
        {"/api/trust", R"({"mac": 42})", "MAC address required"},
        {"/api/remove", R"({"mac": "zz:zz"})", "Invalid MAC address: zz:zz"},
        {"/api/info", "not json", "Invalid JSON body"},
        {"/api/battery", "[1, 2]", "Invalid JSON body"},
        {"/api/power", R"({"state": "on"})", "Field 'state' must be a boolean"},
        {"/api/scan", "{}", "Field 'state' must be a boolean"},
        {"/api/connect", R"({"mac": "00:11:22:33:44:56", "full_sequence": "yes"})",
         "Field 'full_sequence' must be a boolean"},
        {"/api/command", "{}", "Command required"},
        {"/api/command", R"({"command": "scan on\nscan off"})", "Command must be a single line"},
    };

    for (const auto& c : cases) {
        INFO(c.target << " " << c.body);
        const auto response = fx.call(makeRequest(http::verb::post, c.target, c.body));
        CHECK(response.result() == http::status::bad_request);
        const auto body = RouterFixture::body(response);
        CHECK(body.at("success") == false);
        CHECK(body.at("error") == c.error);
    }
}

TEST_CASE("Router reports controller failures as server errors", "[router]") {
    RouterFixture fx;

    const auto pair = fx.call(makeRequest(http::verb::post, "/api/pair", R"({"mac": "00-11-22-33-44-56"})"));
    CHECK(pair.result() == http::status::internal_server_error);
    CHECK(RouterFixture::body(pair).at("error") == "bluetoothctl not connected");

    const auto power = fx.call(makeRequest(http::verb::post, "/api/power", R"({"state": true})"));
    CHECK(power.result() == http::status::internal_server_error);
    CHECK(RouterFixture::body(power).at("error") == "bluetoothctl not connected");

    const auto init = fx.call(makeRequest(http::verb::post, "/api/init"));
    CHECK(init.result() == http::status::internal_server_error);
    CHECK(RouterFixture::body(init).at("error") == "Failed to start bluetoothctl");
}

TEST_CASE("Router handles WebSocket client messages", "[router]") {
    RouterFixture fx;
    RecordingSubscriber client;

    fx.router.handle_ws_message(client, R"({"type": "ping"})");
    REQUIRE(client.received.size() == 1);
    CHECK(client.received.back().at("type") == "pong");

    fx.router.handle_ws_message(client, R"({"type": "request-status"})");
    REQUIRE(client.received.size() == 2);
    CHECK(client.received.back().at("type") == "system-status");
    CHECK(client.received.back().at("bluetooth_connected") == false);

    fx.router.handle_ws_message(client, "not json");
    fx.router.handle_ws_message(client, R"({"type": 5})");
    fx.router.handle_ws_message(client, R"({"type": "subscribe"})");
    CHECK(client.received.size() == 2);
}

TEST_CASE("Bridge serves HTTP and WebSocket clients on one port", "[router][server]") {
    const auto dir = makeTempDir();
    asio::io_context io;
    podbridge::server::BridgeApp app(io, makeConfig(dir));
    app.start();
    const auto port = app.port();
    REQUIRE(port != 0);

    std::atomic<bool> done{false};
    unsigned health_status = 0;
    std::string health_body;
    std::string first_event;
    std::string pong;
    std::string client_error;

    std::thread client([&] {
        try {
            asio::io_context client_io;
            const asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);

            beast::tcp_stream stream(client_io);
            stream.connect(endpoint);
            http::request<http::empty_body> request{http::verb::get, "/health", 11};
            request.set(http::field::host, "127.0.0.1");
            http::write(stream, request);
            beast::flat_buffer buffer;
            http::response<http::string_body> response;
            http::read(stream, buffer, response);
            health_status = response.result_int();
            health_body = response.body();
            beast::error_code ignored;
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);

            websocket::stream<asio::ip::tcp::socket> ws(client_io);
            ws.next_layer().connect(endpoint);
            ws.handshake("127.0.0.1", "/");

            beast::flat_buffer ws_buffer;
            ws.read(ws_buffer);
            first_event = beast::buffers_to_string(ws_buffer.data());
            ws_buffer.consume(ws_buffer.size());

            ws.write(asio::buffer(std::string(R"({"type":"ping"})")));
            for (int i = 0; i < 5 && pong.empty(); ++i) {
                ws.read(ws_buffer);
                const auto message = json::parse(beast::buffers_to_string(ws_buffer.data()));
                ws_buffer.consume(ws_buffer.size());
                if (message.at("type") == "pong") {
                    pong = message.dump();
                }
            }
            ws.close(websocket::close_code::normal);
        } catch (const std::exception& ex) {
            client_error = ex.what();
        }
        done = true;
    });

    const bool finished = runUntil(io, [&] { return done.load(); }, std::chrono::milliseconds(10000));
    client.join();
    app.stop();
    std::filesystem::remove_all(dir);

    REQUIRE(finished);
    INFO(client_error);
    REQUIRE(client_error.empty());
    CHECK(health_status == 200);
    CHECK(json::parse(health_body).at("status") == "ok");
    CHECK(json::parse(first_event).at("type") == "system-status");
    CHECK_FALSE(pong.empty());
}
