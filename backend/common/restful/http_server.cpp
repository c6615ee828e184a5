#include "http_server.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace common {

namespace {
constexpr auto kReadTimeout = std::chrono::seconds(30);
// Large enough to push a 100 MiB body to a slow client.
constexpr auto kWriteTimeout = std::chrono::minutes(5);
}

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       net::thread_pool& workers)
  : ioc_(ioc), acceptor_(ioc), api_handler_(api_handler), workers_(workers) {

  beast::error_code ec;

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    throw std::runtime_error("Failed to open acceptor: " + ec.message());
  }

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    throw std::runtime_error("Failed to set reuse_address: " + ec.message());
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    throw std::runtime_error("Failed to bind: " + ec.message());
  }

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Failed to listen: " + ec.message());
  }
}

void HttpServer::run() {
  doAccept();
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    spdlog::warn("Accept error: {}", ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, workers_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         net::thread_pool& workers)
  : stream_(std::move(socket)), api_handler_(api_handler), workers_(workers) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};

  stream_.expires_after(kReadTimeout);

  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec) {
    if (ec != beast::error::timeout) {
      spdlog::warn("Read error: {}", ec.message());
    }
    return;
  }

  net::post(workers_, [self = shared_from_this(), req = std::move(req_)]() mutable {
    auto response = self->api_handler_->handleRequest(std::move(req));
    net::post(self->stream_.get_executor(),
              [self, response = std::move(response)]() mutable {
                self->doWrite(std::move(response));
              });
  });
}

void HttpSession::doWrite(http::response<http::string_body>&& response) {
  auto shared_response = std::make_shared<http::response<http::string_body>>(std::move(response));
  res_ = shared_response;

  stream_.expires_after(kWriteTimeout);

  http::async_write(stream_, *shared_response,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                            shared_response->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    spdlog::warn("Write error: {}", ec.message());
    return;
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
