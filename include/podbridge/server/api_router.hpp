#pragma once

#include <string>

#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>

#include "podbridge/bluetooth/bluetooth_controller.hpp"
#include "podbridge/bluetooth/event_broadcaster.hpp"
#include "podbridge/server/http_server.hpp"

namespace podbridge::server {

// Maps the JSON HTTP API and inbound WebSocket messages onto the controller.
class ApiRouter {
public:
    ApiRouter(bluetooth::BluetoothController& controller, bluetooth::EventBroadcaster& broadcaster);

    void handle(const HttpRequest& request, HttpServer::Responder respond);
    void handle_ws_message(bluetooth::EventSubscriber& subscriber, const std::string& text);

    static HttpResponse json_response(boost::beast::http::status status, const nlohmann::json& body,
                                      unsigned version = 11);

private:
    bluetooth::BluetoothController& controller_;
    bluetooth::EventBroadcaster& broadcaster_;
};

}  // namespace podbridge::server
