#pragma once

#include "core/error.hpp"
#include "http/reply.hpp"
#include "logging/console.hpp"
#include "net/backoff.hpp"
#include "util/thread.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// HttpServer
// Threading model:
// - One accept thread polls the listening socket in 200 ms slices and
//   honours its stop token
// - Every connection gets its own thread doing blocking Beast reads and
//   writes; a streamed reply keeps that thread until the event channel
//   completes or the client goes away
// - Stop() shuts down every open connection socket so blocked reads return,
//   then joins the threads with a bounded wait
class HttpServer {
public:
  using Handler = std::function<Reply(const HttpRequest &)>;

  explicit HttpServer(Handler handler) : handler_(std::move(handler)) {}
  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;
  ~HttpServer() { Stop(); }

  Status Start(const std::string &address, std::uint16_t port) {
    boost::system::error_code ec;
    auto addr = net::ip::make_address(address, ec);
    if (ec) {
      return MakeError(ErrorKind::kInvalidArgument,
                       "bad listen address " + address);
    }
    tcp::endpoint ep(addr, port);
    acceptor_.open(ep.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(ep, ec);
    }
    if (!ec) {
      acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
      acceptor_.non_blocking(true, ec);
    }
    if (ec) {
      return MakeStatus(ec);
    }
    port_ = acceptor_.local_endpoint().port();
    logging::Info("http", "",
                  "listening on " + address + ":" + std::to_string(port_));
    acceptor_thread_.Start([this](std::stop_token st) { AcceptLoop(st); });
    return {};
  }

  std::uint16_t Port() const { return port_; }

  void Stop() noexcept {
    if (stopped_.exchange(true)) {
      return;
    }
    (void)acceptor_thread_.JoinFor(std::chrono::seconds(2));
    std::list<std::shared_ptr<Connection>> conns;
    {
      std::lock_guard lk(conns_mu_);
      conns.swap(conns_);
    }
    for (auto &c : conns) {
      c->Shutdown();
    }
    for (auto &c : conns) {
      if (!c->thread.JoinFor(std::chrono::seconds(3))) {
        logging::Warn("http", "", "connection thread did not exit in time");
      }
    }
  }

private:
  struct Connection {
    explicit Connection(tcp::socket s) : socket(std::move(s)) {}

    // Wakes a blocked read; a streaming writer fails on its next frame.
    void Shutdown() { ::shutdown(socket.native_handle(), SHUT_RDWR); }

    tcp::socket socket;
    BoundedThread thread;
    std::atomic<bool> done{false};
  };

  void AcceptLoop(std::stop_token st) {
    retry::Backoff backoff;
    while (!st.stop_requested()) {
      pollfd p{acceptor_.native_handle(), POLLIN, 0};
      int rc = ::poll(&p, 1, 200);
      if (rc <= 0) {
        continue;
      }
      boost::system::error_code ec;
      tcp::socket sock(ioc_);
      acceptor_.accept(sock, ec);
      if (ec == net::error::would_block || ec == net::error::try_again) {
        continue;
      }
      if (ec) {
        logging::Error("http", "", "accept", ec.message());
        retry::WaitSync(backoff.Next(), st);
        continue;
      }
      backoff.Reset();
      sock.non_blocking(false, ec);
      auto conn = std::make_shared<Connection>(std::move(sock));
      {
        std::lock_guard lk(conns_mu_);
        conns_.remove_if([](const std::shared_ptr<Connection> &c) {
          return c->done.load();
        });
        conns_.push_back(conn);
      }
      conn->thread.Start([this, conn](std::stop_token) {
        Serve(*conn);
        conn->done.store(true);
      });
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
  }

  void Serve(Connection &c) {
    beast::flat_buffer buffer;
    for (;;) {
      HttpRequest req;
      boost::system::error_code ec;
      http::read(c.socket, buffer, req, ec);
      if (ec == http::error::end_of_stream || ec == net::error::eof) {
        break;
      }
      if (ec) {
        if (ec != net::error::connection_reset &&
            ec != net::error::operation_aborted && !stopped_.load()) {
          logging::Debug("http", "", "read error: " + ec.message());
        }
        break;
      }
      const bool keepAlive = req.keep_alive();
      Reply reply = Dispatch(req);
      if (auto *resp = std::get_if<HttpResponse>(&reply)) {
        resp->keep_alive(keepAlive);
        resp->prepare_payload();
        http::write(c.socket, *resp, ec);
        if (ec || !keepAlive) {
          break;
        }
        continue;
      }
      WriteStream(c, std::get<StreamReply>(reply), req.version());
      break;
    }
    boost::system::error_code ec;
    c.socket.shutdown(tcp::socket::shutdown_send, ec);
    c.socket.close(ec);
  }

  Reply Dispatch(const HttpRequest &req) {
    try {
      return handler_(req);
    } catch (const std::exception &e) {
      logging::Error("http", "", "handler", e.what());
      HttpResponse res{http::status::internal_server_error, req.version()};
      res.set(http::field::content_type, "application/json");
      res.body() = R"({"success":false,"error":"internal error"})";
      return res;
    }
  }

  // Chunked text/event-stream until the complete event or a failed write;
  // a failed write detaches the channel so the producer stops queueing.
  void WriteStream(Connection &c, StreamReply &stream, unsigned version) {
    http::response<http::empty_body> head{http::status::ok, version};
    head.set(http::field::content_type, "text/event-stream");
    head.set(http::field::cache_control, "no-cache");
    head.chunked(true);
    http::response_serializer<http::empty_body> sr{head};
    boost::system::error_code ec;
    http::write_header(c.socket, sr, ec);
    if (ec) {
      stream.channel->Detach();
      return;
    }
    bool ok = true;
    stream.channel->Drain([&](const Event &ev) {
      const std::string frame = "data: " + stream.format(ev) + "\n\n";
      net::write(c.socket, http::make_chunk(net::buffer(frame)), ec);
      ok = !ec;
      return ok;
    });
    if (ok) {
      net::write(c.socket, http::make_chunk_last(), ec);
    }
  }

  Handler handler_;
  net::io_context ioc_;
  tcp::acceptor acceptor_{ioc_};
  std::uint16_t port_ = 0;
  BoundedThread acceptor_thread_;
  std::mutex conns_mu_;
  std::list<std::shared_ptr<Connection>> conns_;
  std::atomic<bool> stopped_{false};
};
