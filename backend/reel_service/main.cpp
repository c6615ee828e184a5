#include "application/download_service.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/api_metadata_resolver.hpp"
#include "infrastructure/curl_http_client.hpp"
#include "infrastructure/http_media_fetcher.hpp"
#include "infrastructure/steady_clock.hpp"
#include "interface/rest_api_handler.hpp"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <csignal>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();

    spdlog::set_pattern(cfg.getLog().pattern);
    spdlog::set_level(spdlog::level::from_str(cfg.getLog().level));

    auto transport = std::make_shared<reel_service::CurlHttpClient>();
    auto clock = std::make_shared<reel_service::SteadyClock>();

    auto resolver = std::make_shared<reel_service::ApiMetadataResolver>(
      transport, clock, cfg.getResolver(), cfg.getUserAgent()
    );
    auto fetcher = std::make_shared<reel_service::HttpMediaFetcher>(
      transport, cfg.getFetcher(), cfg.getUserAgent()
    );
    auto download_service = std::make_shared<reel_service::ReelDownloadService>(resolver, fetcher);

    const auto& server_config = cfg.getServer();
    auto api_handler = std::make_shared<reel_service::RestApiHandler>(
      download_service, clock, cfg.isDevelopment()
    );

    boost::asio::io_context ioc{1};
    boost::asio::thread_pool workers{server_config.worker_threads};

    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(server_config.host),
      server_config.port
    };
    common::HttpServer http_server{ioc, http_endpoint, api_handler, workers};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int signal_number) {
      spdlog::info("Received signal {}, shutting down", signal_number);
      ioc.stop();
    });

    spdlog::info("Server running on {}:{} (environment: {})",
                 server_config.host, server_config.port, server_config.environment);

    http_server.run();
    ioc.run();

    workers.stop();
    workers.join();
    return 0;
  } catch (const std::exception& e) {
    spdlog::critical("Error: {}", e.what());
    return 1;
  }
}
