#pragma once

#include <cstdint>
#include <string>

#include <boost/asio/io_context.hpp>

#include "podbridge/bluetooth/bluetooth_controller.hpp"
#include "podbridge/bluetooth/device_store.hpp"
#include "podbridge/bluetooth/event_broadcaster.hpp"
#include "podbridge/server/api_router.hpp"
#include "podbridge/server/http_server.hpp"
#include "podbridge/util/config_loader.hpp"

namespace podbridge::server {

class BridgeApp {
public:
    BridgeApp(boost::asio::io_context& io_context, BridgeConfig config);

    void start();
    void stop();

    std::uint16_t port() const { return http_server_.port(); }
    bluetooth::BluetoothController& controller() { return controller_; }

private:
    boost::asio::io_context& io_context_;
    BridgeConfig config_;
    bluetooth::JsonDeviceStore device_store_;
    bluetooth::EventBroadcaster broadcaster_;
    bluetooth::BluetoothController controller_;
    ApiRouter router_;
    HttpServer http_server_;
};

int run(const std::string& config_path, const std::string& log_level_override = {});

}  // namespace podbridge::server
