#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/http.hpp>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "rpcbridge/bridge.hpp"

namespace rpcbridge {

struct server_options {
  std::string host{"0.0.0.0"};
  unsigned short port{8000};
  std::string base_path{"/"};
  std::string name{"rpcbridge"};
  std::size_t max_connections{64};
  bool handle_signals{false};
};

using http_request =
    boost::beast::http::request<boost::beast::http::string_body>;
using http_response =
    boost::beast::http::response<boost::beast::http::string_body>;

// Answer one HTTP request addressed to the bridge.  Defined in
// web_handlers.cpp; never throws.
http_response dispatch(
    const http_request& req, bridge& b, const server_options& opts);

// Serve one accepted connection (keep-alive loop) on the calling thread.
void handle_connection(
    boost::asio::ip::tcp::socket& socket, bridge& b,
    const server_options& opts);

/** @brief Thread-per-connection HTTP front end for a bridge.
 *
 * Accepting happens on the thread that calls run(); every accepted
 * connection gets a worker thread that blocks in Beast's synchronous
 * read/write calls and, per request, in bridge::handle().
 */
class web_server {
 public:
  web_server(bridge& b, server_options opts);
  web_server(const web_server&) = delete;
  web_server& operator=(const web_server&) = delete;
  ~web_server();

  // Bind and listen.  Returns the bound port (useful with port 0).
  unsigned short listen();

  // Serve until stop() (or SIGINT/SIGTERM with handle_signals).
  void run();

  // Stop accepting and cut live connections.  Thread-safe.
  void stop();

  [[nodiscard]] unsigned short port() const { return port_; }

 private:
  struct worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void do_accept();
  void reject(boost::asio::ip::tcp::socket& socket);
  void reap_finished();

  bridge* bridge_;
  server_options opts_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_{ioc_};
  boost::asio::signal_set signals_{ioc_};
  boost::asio::ip::tcp protocol_{boost::asio::ip::tcp::v4()};
  unsigned short port_{0};

  std::atomic<std::size_t> active_{0};
  std::list<worker> workers_;
  std::mutex live_mutex_;
  std::unordered_set<int> live_fds_;
  bool stopping_{false};
};

}  // namespace rpcbridge
