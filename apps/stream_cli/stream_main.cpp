#include "marketstream/Config.hpp"
#include "marketstream/Log.hpp"
#include "marketstream/hub/ConnectionHub.hpp"
#include "marketstream/realtime/MarketRealtimeClient.hpp"
#include "marketstream/sinks/LoggingSinkAdapter.hpp"
#include "marketstream/telemetry/MetricsBus.hpp"
#include "marketstream/ws/BeastWsTransport.hpp"
#include "marketstream/ws/Scheduler.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>

using namespace MarketStream;

namespace {

std::string resolveToken(int argc, char** argv) {
    if (auto token = Config::argValue(argc, argv, "--token"); !token.empty()) return token;
    if (const char* env = std::getenv("MARKETSTREAM_TOKEN")) return env;
    return {};
}

} // namespace

int main(int argc, char** argv) {
    Config config;
    try {
        config = Config::fromArgs(argc, argv);
        config.validate();
    } catch (const ConfigError& e) {
        LOG_E("config", "{}", e.what());
        return 2;
    }
    const auto token = resolveToken(argc, argv);
    LOG_I("cli", "starting market stream: {}", config.describe());

    boost::asio::io_context ioc;
    boost::asio::ssl::context sslCtx{boost::asio::ssl::context::tlsv12_client};
    sslCtx.set_default_verify_paths();
    sslCtx.set_verify_mode(boost::asio::ssl::verify_peer);

    AsioScheduler scheduler{ioc};
    ConnectionHub hub{scheduler, BeastWsTransport::factory(ioc, sslCtx), config.hubConfig()};
    MetricsBus metrics;
    LoggingSinkAdapter sink;

    metrics.subscribe([](const TelemetryEvent& event) {
        LOG_D("telemetry", "{} {}", event.name(), event.fields.dump());
    });

    RealtimeOptions options;
    options.tokenProvider = [&token] { return token; };
    options.symbolProvider = [&config] { return config.symbol; };
    options.timeframeProvider = [&config] { return config.timeframe; };

    MarketRealtimeClient client{hub, scheduler, sink, metrics, std::move(options), config.realtimeConfig()};

    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        LOG_I("cli", "signal {} received, shutting down", signo);
        client.disconnect();
        hub.shutdown();
        ioc.stop();
    });

    client.connect();
    if (!client.isStarted()) {
        LOG_E("cli", "client did not start; pass --token or set MARKETSTREAM_TOKEN");
        return 1;
    }

    try {
        ioc.run();
    } catch (const std::exception& e) {
        LOG_E("cli", "event loop terminated: {}", e.what());
        return 1;
    }
    LOG_I("cli", "stopped");
    return 0;
}
