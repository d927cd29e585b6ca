#include "podbridge/server/api_router.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "podbridge/bluetooth/device.hpp"
#include "podbridge/bluetooth/messages.hpp"
#include "podbridge/util/logging.hpp"

namespace podbridge::server {

namespace {

namespace http = boost::beast::http;
using Json = nlohmann::json;

struct BadRequest : std::runtime_error {
    using std::runtime_error::runtime_error;
};

Json error_body(const std::string& message) {
    return Json{{"success", false}, {"error", message}};
}

Json parse_body(const HttpRequest& request) {
    if (request.body().empty()) {
        return Json::object();
    }
    auto body = Json::parse(request.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw BadRequest("Invalid JSON body");
    }
    return body;
}

bool require_bool(const Json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_boolean()) {
        throw BadRequest(std::string("Field '") + field + "' must be a boolean");
    }
    return it->get<bool>();
}

std::string require_mac(const Json& body) {
    auto it = body.find("mac");
    if (it == body.end() || !it->is_string()) {
        throw BadRequest("MAC address required");
    }
    auto mac = bluetooth::normalize_mac(it->get<std::string>());
    if (!mac) {
        throw BadRequest("Invalid MAC address: " + it->get<std::string>());
    }
    return *mac;
}

std::string require_command(const Json& body) {
    auto it = body.find("command");
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw BadRequest("Command required");
    }
    auto command = it->get<std::string>();
    if (command.find_first_of("\r\n") != std::string::npos) {
        throw BadRequest("Command must be a single line");
    }
    return command;
}

bool optional_bool(const Json& body, const char* field, const char* alias, bool fallback) {
    for (const char* name : {field, alias}) {
        auto it = body.find(name);
        if (it == body.end()) {
            continue;
        }
        if (!it->is_boolean()) {
            throw BadRequest(std::string("Field '") + name + "' must be a boolean");
        }
        return it->get<bool>();
    }
    return fallback;
}

std::string route_path(const HttpRequest& request) {
    std::string target(request.target());
    const auto query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }
    if (target.size() > 1 && target.back() == '/') {
        target.pop_back();
    }
    return target;
}

Json merge_success(const Json& payload) {
    Json body{{"success", true}};
    if (payload.is_object()) {
        body.update(payload);
    }
    return body;
}

}  // namespace

ApiRouter::ApiRouter(bluetooth::BluetoothController& controller, bluetooth::EventBroadcaster& broadcaster)
    : controller_(controller), broadcaster_(broadcaster) {}

HttpResponse ApiRouter::json_response(http::status status, const Json& body, unsigned version) {
    HttpResponse response{status, version};
    response.set(http::field::server, "podbridge");
    response.set(http::field::content_type, "application/json");
    response.set(http::field::access_control_allow_origin, "*");
    response.body() = bluetooth::messages::serialize(body);
    response.prepare_payload();
    return response;
}

void ApiRouter::handle(const HttpRequest& request, HttpServer::Responder respond) {
    const auto version = request.version();
    const auto method = request.method();
    const auto path = route_path(request);

    auto reply = [respond, version](http::status status, const Json& body) {
        respond(json_response(status, body, version));
    };
    auto reply_result = [reply](bluetooth::ApiResult result) {
        if (result.ok) {
            reply(http::status::ok, merge_success(result.payload));
        } else {
            reply(http::status::internal_server_error, error_body(result.error));
        }
    };

    util::log::debug("[http] " + std::string(request.method_string()) + " " + path);

    if (method == http::verb::options) {
        HttpResponse response{http::status::no_content, version};
        response.set(http::field::access_control_allow_origin, "*");
        response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        response.set(http::field::access_control_allow_headers, "Content-Type");
        response.prepare_payload();
        respond(std::move(response));
        return;
    }

    using MacOperation = void (bluetooth::BluetoothController::*)(const std::string&, bluetooth::ApiHandler);
    static const std::unordered_map<std::string, MacOperation> mac_operations{
        {"/api/pair", &bluetooth::BluetoothController::pair},
        {"/api/trust", &bluetooth::BluetoothController::trust},
        {"/api/disconnect", &bluetooth::BluetoothController::disconnect},
        {"/api/remove", &bluetooth::BluetoothController::remove},
        {"/api/info", &bluetooth::BluetoothController::info},
        {"/api/battery", &bluetooth::BluetoothController::battery},
    };

    try {
        if (method == http::verb::get) {
            if (path == "/health") {
                reply(http::status::ok, controller_.health());
            } else if (path == "/api/devices") {
                reply(http::status::ok, merge_success(controller_.devices()));
            } else if (path == "/api/status") {
                reply(http::status::ok, merge_success(controller_.status()));
            } else {
                reply(http::status::not_found, error_body("Not found"));
            }
            return;
        }

        if (method != http::verb::post) {
            reply(http::status::not_found, error_body("Not found"));
            return;
        }

        if (path == "/api/init") {
            if (controller_.initialize()) {
                reply(http::status::ok, Json{{"success", true}, {"message", "Bluetooth initialized"}});
            } else {
                reply(http::status::internal_server_error, error_body("Failed to start bluetoothctl"));
            }
            return;
        }

        if (auto op = mac_operations.find(path); op != mac_operations.end()) {
            const auto mac = require_mac(parse_body(request));
            (controller_.*(op->second))(mac, reply_result);
            return;
        }

        if (path == "/api/power") {
            controller_.set_power(require_bool(parse_body(request), "state"), reply_result);
        } else if (path == "/api/scan") {
            controller_.set_scan(require_bool(parse_body(request), "state"), reply_result);
        } else if (path == "/api/connect") {
            const auto body = parse_body(request);
            const auto mac = require_mac(body);
            controller_.connect(mac, optional_bool(body, "full_sequence", "fullSequence", true), reply_result);
        } else if (path == "/api/command") {
            controller_.raw_command(require_command(parse_body(request)), reply_result);
        } else {
            reply(http::status::not_found, error_body("Not found"));
        }
    } catch (const BadRequest& ex) {
        reply(http::status::bad_request, error_body(ex.what()));
    }
}

void ApiRouter::handle_ws_message(bluetooth::EventSubscriber& subscriber, const std::string& text) {
    auto message = Json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        util::log::warn("[websocket] Ignoring malformed message");
        return;
    }

    std::string type;
    if (auto it = message.find("type"); it != message.end() && it->is_string()) {
        type = it->get<std::string>();
    }
    if (type == "ping") {
        subscriber.deliver(
            std::make_shared<const std::string>(bluetooth::messages::serialize(bluetooth::messages::pong())));
    } else if (type == "request-status") {
        util::log::info("[websocket] Sending status on request");
        broadcaster_.replay(subscriber);
    } else {
        util::log::debug("[websocket] Ignoring message of type '" + type + "'");
    }
}

}  // namespace podbridge::server
