#include "web_server.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/json.hpp>
#include <csignal>
#include <utility>

#include "../librpcbridge/logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace rpcbridge {

web_server::web_server(bridge& b, server_options opts)
    : bridge_{&b}, opts_{std::move(opts)} {}

web_server::~web_server() {
  stop();
  for (auto& w : workers_) {
    if (w.thread.joinable()) w.thread.join();
  }
}

unsigned short web_server::listen() {
  tcp::endpoint endpoint{net::ip::make_address(opts_.host), opts_.port};
  protocol_ = endpoint.protocol();
  acceptor_.open(protocol_);
  acceptor_.set_option(net::socket_base::reuse_address{true});
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();
  return port_;
}

void web_server::run() {
  if (opts_.handle_signals) {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int sig) {
      if (ec) return;
      LOG_INFO("Received signal {}, shutting down", sig);
      stop();
    });
  }
  do_accept();
  ioc_.run();
}

void web_server::stop() {
  {
    std::lock_guard lock{live_mutex_};
    stopping_ = true;
    // Wakes workers blocked reading an idle keep-alive connection.
    for (int fd : live_fds_) ::shutdown(fd, SHUT_RDWR);
  }
  net::post(ioc_, [this] {
    boost::system::error_code ec{};
    acceptor_.close(ec);
    signals_.cancel(ec);
  });
}

void web_server::do_accept() {
  acceptor_.async_accept([this](
                             const boost::system::error_code& ec,
                             tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;  // acceptor was closed
    if (ec) {
      LOG_WARN("accept failed: {}", ec.message());
      do_accept();
      return;
    }

    reap_finished();
    if (active_.load() >= opts_.max_connections) {
      reject(socket);
      do_accept();
      return;
    }

    boost::system::error_code ec2;
    auto remote = socket.remote_endpoint(ec2);
    LOG_DEBUG(
        "connection from {}:{}", ec2 ? "?" : remote.address().to_string(),
        ec2 ? 0 : remote.port());

    // Transfer socket ownership into the worker via native handle.
    int fd = socket.release();
    {
      std::lock_guard lock{live_mutex_};
      if (stopping_) {
        ::close(fd);
        return;
      }
      live_fds_.insert(fd);
    }

    ++active_;
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(worker{
      std::thread{[this, fd, done, protocol = protocol_]() {
        logger::set_thread_tag("http");
        // Each worker thread owns its own io_context for purely synchronous
        // use.
        net::io_context ioc;
        tcp::socket sock{ioc};
        boost::system::error_code aec;
        sock.assign(protocol, fd, aec);
        if (!aec) handle_connection(sock, *bridge_, opts_);
        {
          std::lock_guard lock{live_mutex_};
          live_fds_.erase(fd);
          if (aec) {
            ::close(fd);
          } else {
            sock.close(aec);
          }
        }
        --active_;
        *done = true;
      }},
      done});

    do_accept();
  });
}

void web_server::reject(tcp::socket& socket) {
  LOG_WARN(
      "Refusing connection: {} connections already open",
      opts_.max_connections);
  json::object body;
  body["error"] = "too many connections";
  http::response<http::string_body> res{http::status::service_unavailable, 11};
  res.set(http::field::content_type, "application/json");
  res.set(http::field::access_control_allow_origin, "*");
  res.keep_alive(false);
  res.body() = json::serialize(body);
  res.prepare_payload();
  boost::system::error_code ec;
  http::write(socket, res, ec);
  socket.shutdown(tcp::socket::shutdown_both, ec);
  socket.close(ec);
}

void web_server::reap_finished() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace rpcbridge
