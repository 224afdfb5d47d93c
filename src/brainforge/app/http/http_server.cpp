#include "brainforge/app/http/http_server.hpp"

#include "brainforge/app/http/router.hpp"
#include "brainforge/core/asio_awaitable.hpp"
#include "brainforge/core/runtime.hpp"
#include "brainforge/util/log.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <atomic>
#include <chrono>
#include <mutex>

namespace brainforge::http {

namespace {
constexpr auto kHttpIoTimeout = std::chrono::seconds(30);
constexpr std::uint32_t kParserHeaderLimit = 64 * 1024;
constexpr std::uint64_t kParserBodyLimit = 10ULL * 1024ULL * 1024ULL;

namespace beast = boost::beast;
namespace beast_http = beast::http;
using tcp = boost::asio::ip::tcp;

using BeastRequest = beast_http::request<beast_http::string_body>;
using BeastResponse = beast_http::response<beast_http::string_body>;

auto to_method(beast_http::verb verb) noexcept -> HttpMethod {
  switch (verb) {
  case beast_http::verb::get:
    return HttpMethod::GET;
  case beast_http::verb::post:
    return HttpMethod::POST;
  case beast_http::verb::put:
    return HttpMethod::PUT;
  case beast_http::verb::delete_:
    return HttpMethod::DELETE;
  case beast_http::verb::patch:
    return HttpMethod::PATCH;
  case beast_http::verb::options:
    return HttpMethod::OPTIONS;
  case beast_http::verb::head:
    return HttpMethod::HEAD;
  default:
    return HttpMethod::GET;
  }
}

auto to_request(BeastRequest &msg) -> HttpRequest {
  HttpRequest out;
  out.method = to_method(msg.method());

  std::string target(msg.target());
  if (auto parsed = boost::urls::parse_origin_form(target); parsed) {
    out.path = std::string(parsed->encoded_path());
    if (auto query = parsed->encoded_query(); !query.empty()) {
      out.query_string.assign(query.data(), query.size());
    }
  } else {
    out.path = std::move(target);
  }

  for (const auto &field : msg.base()) {
    out.headers.insert_or_assign(
        boost::algorithm::to_lower_copy(std::string(field.name_string())),
        std::string(field.value()));
  }
  out.body = std::move(msg.body());
  return out;
}

auto to_beast_response(HttpResponse &resp, unsigned version, bool keep_alive)
    -> BeastResponse {
  BeastResponse out{static_cast<beast_http::status>(resp.status), version};
  out.keep_alive(keep_alive);
  for (const auto &[k, v] : resp.headers) {
    out.set(k, v);
  }
  out.set(beast_http::field::cache_control, "no-store");
  out.set("x-content-type-options", "nosniff");
  out.body() = std::move(resp.body);
  out.prepare_payload();
  return out;
}
} // namespace

struct HttpServer::Impl {
  Runtime &runtime;
  Router router_;
  std::atomic<bool> running{false};
  std::atomic<std::uint16_t> bound_port{0};
  std::mutex acceptor_mu;
  std::shared_ptr<tcp::acceptor> acceptor;
  unsigned acceptor_shard{0};

  explicit Impl(Runtime &rt) : runtime(rt) {}

  auto handle_connection(tcp::socket socket) -> spawn_task {
    beast::flat_buffer read_buffer;
    try {
      while (running.load(std::memory_order_acquire)) {
        beast_http::request_parser<beast_http::string_body> parser;
        parser.header_limit(kParserHeaderLimit);
        parser.body_limit(kParserBodyLimit);

        auto [read_ec, read_n] = co_await beast_http::async_read(
            socket, read_buffer, parser,
            boost::asio::cancel_after(kHttpIoTimeout, brainforge::use_nothrow));
        (void)read_n;
        if (read_ec) {
          if (read_ec != boost::asio::error::eof &&
              read_ec != beast::error::timeout &&
              read_ec != boost::asio::error::operation_aborted &&
              read_ec != beast_http::error::end_of_stream) {
            log::warn("HTTP read failed: {}", read_ec.message());
          }
          break;
        }

        auto beast_req = parser.release();
        const auto version = beast_req.version();
        const auto keep_alive = beast_req.keep_alive();
        auto req = to_request(beast_req);
        log::debug("HTTP request: {} {}", req.method, req.path);

        auto resp = co_await router_.route(std::move(req));
        auto beast_resp = to_beast_response(resp, version, keep_alive);

        auto [write_ec, written] = co_await beast_http::async_write(
            socket, beast_resp,
            boost::asio::cancel_after(kHttpIoTimeout, brainforge::use_nothrow));
        (void)written;
        if (write_ec) {
          log::warn("HTTP write failed: {}", write_ec.message());
          break;
        }
        if (!keep_alive) {
          break;
        }
      }
    } catch (const std::exception &e) {
      log::error("Exception in connection handler: {}", e.what());
    }

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }

  auto open_acceptor(tcp::endpoint endpoint, shard_id shard)
      -> Result<std::shared_ptr<tcp::acceptor>> {
    auto acc = std::make_shared<tcp::acceptor>(runtime.executor_for(shard));
    boost::system::error_code ec;
    acc->open(endpoint.protocol(), ec);
    if (ec) {
      log::error("Failed to open acceptor: {}", ec.message());
      return fail(Error::InvalidArgument);
    }
    acc->set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      log::warn("Failed to set SO_REUSEADDR: {}", ec.message());
      ec.clear();
    }
    acc->bind(endpoint, ec);
    if (ec) {
      log::error("Failed to bind {}:{}: {}", endpoint.address().to_string(),
                 endpoint.port(), ec.message());
      return fail(Error::InvalidArgument);
    }
    acc->listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      log::error("Failed to listen on {}:{}: {}",
                 endpoint.address().to_string(), endpoint.port(),
                 ec.message());
      return fail(Error::InvalidArgument);
    }
    return acc;
  }

  auto accept_loop(std::shared_ptr<tcp::acceptor> acc) -> spawn_task {
    while (running.load(std::memory_order_acquire)) {
      // Each connection gets its own shard executor.
      const auto target = static_cast<shard_id>(
          next_shard.fetch_add(1, std::memory_order_relaxed) %
          runtime.shard_count());
      tcp::socket socket(runtime.executor_for(target));
      auto [accept_ec] =
          co_await acc->async_accept(socket, brainforge::use_nothrow);
      if (accept_ec) {
        if (running && accept_ec != boost::asio::error::operation_aborted) {
          log::error("Accept failed: {}", accept_ec.message());
        }
        break;
      }

      boost::system::error_code nodelay_ec;
      socket.set_option(tcp::no_delay(true), nodelay_ec);
      if (nodelay_ec) {
        log::warn("Failed to set TCP_NODELAY: {}", nodelay_ec.message());
      }
      runtime.spawn_on(target, handle_connection(std::move(socket)));
    }
  }

  std::atomic<std::uint64_t> next_shard{0};
};

HttpServer::HttpServer(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

HttpServer::~HttpServer() { stop(); }

auto HttpServer::router() -> Router & { return impl_->router_; }

auto HttpServer::start(std::string_view host, std::uint16_t port)
    -> task<Result<void>> {
  auto impl = impl_;

  boost::system::error_code addr_ec;
  boost::asio::ip::address bind_address;
  if (host == "0.0.0.0" || host.empty()) {
    bind_address = boost::asio::ip::address_v4::any();
  } else {
    bind_address = boost::asio::ip::make_address(std::string(host), addr_ec);
  }
  if (addr_ec) {
    log::error("Invalid host address '{}': {}", host, addr_ec.message());
    co_return fail(Error::InvalidArgument);
  }

  auto acc = impl->open_acceptor({bind_address, port}, impl->acceptor_shard);
  if (!acc) {
    co_return fail(acc.error());
  }

  boost::system::error_code ep_ec;
  const auto local = (*acc)->local_endpoint(ep_ec);
  impl->bound_port = ep_ec ? port : local.port();
  {
    std::lock_guard lock(impl->acceptor_mu);
    impl->acceptor = *acc;
  }
  impl->running = true;

  log::info("HTTP server listening on {}:{}", host, impl->bound_port.load());
  impl->runtime.spawn_on(impl->acceptor_shard, impl->accept_loop(*acc));
  co_return ok();
}

auto HttpServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  log::info("Stopping HTTP server...");

  std::shared_ptr<tcp::acceptor> acc;
  {
    std::lock_guard lock(impl_->acceptor_mu);
    acc = std::move(impl_->acceptor);
  }
  if (acc) {
    boost::asio::post(impl_->runtime.executor_for(impl_->acceptor_shard),
                      [acc]() {
                        boost::system::error_code close_ec;
                        acc->cancel(close_ec);
                        acc->close(close_ec);
                      });
  }
  log::info("HTTP server stopped");
}

auto HttpServer::is_running() const -> bool { return impl_->running.load(); }

auto HttpServer::port() const -> std::uint16_t {
  return impl_->bound_port.load();
}

} // namespace brainforge::http
