#include "podbridge/server/app.hpp"

#include <csignal>
#include <memory>
#include <utility>

#include <boost/asio/signal_set.hpp>

#include "podbridge/server/ws_session.hpp"
#include "podbridge/util/logging.hpp"

namespace podbridge::server {

BridgeApp::BridgeApp(boost::asio::io_context& io_context, BridgeConfig config)
    : io_context_(io_context),
      config_(std::move(config)),
      device_store_(config_.storage.path),
      broadcaster_(),
      controller_(io_context_, config_, device_store_, broadcaster_),
      router_(controller_, broadcaster_),
      http_server_(io_context_) {}

void BridgeApp::start() {
    device_store_.load();
    broadcaster_.set_snapshot_provider([this] { return controller_.snapshot_events(); });

    http_server_.set_request_handler(
        [this](const HttpRequest& request, HttpServer::Responder respond) { router_.handle(request, std::move(respond)); });
    http_server_.set_upgrade_handler([this](boost::asio::ip::tcp::socket socket, HttpRequest request) {
        auto session = std::make_shared<WsSession>(std::move(socket));
        session->set_open_handler([this](const std::shared_ptr<WsSession>& opened) {
            opened->set_subscription(broadcaster_.subscribe(opened));
        });
        session->set_message_handler(
            [this](WsSession& client, const std::string& text) { router_.handle_ws_message(client, text); });
        session->set_close_handler([this](WsSession& client) { broadcaster_.unsubscribe(client.subscription()); });
        session->run(std::move(request));
    });

    http_server_.start(config_.server.host, config_.server.port);

    if (config_.bluetooth.auto_start) {
        controller_.initialize();
    } else {
        util::log::info("[bluetooth] Auto-start disabled, waiting for POST /api/init");
    }
}

void BridgeApp::stop() {
    http_server_.stop();
    controller_.shutdown();
}

int run(const std::string& config_path, const std::string& log_level_override) {
    try {
        auto config = config_path.empty() ? BridgeConfig{} : load_config(config_path);
        util::log::set_level(log_level_override.empty() ? config.log_level : log_level_override);
        std::signal(SIGPIPE, SIG_IGN);

        boost::asio::io_context io_context;
        BridgeApp app(io_context, config);
        app.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            util::log::info("Signal received, shutting down...");
            app.stop();
            io_context.stop();
        });

        io_context.run();
    } catch (const std::exception& ex) {
        util::log::error(std::string("Fatal error: ") + ex.what());
        return 1;
    }
    return 0;
}

}  // namespace podbridge::server
