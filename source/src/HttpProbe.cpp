#include "HttpProbe.hpp"

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

boost::asio::awaitable<ProbeResponse> HttpProbe::async_probe() {
    if (stopped()) co_return stopped_failure();

    auto executor = co_await net::this_coro::executor;
    boost::system::error_code ec;

    tcp::resolver resolver(executor);
    boost::beast::tcp_stream stream(executor);

    auto req = build_request();
    auto start = std::chrono::steady_clock::now();

    auto results = co_await resolver.async_resolve(_host, std::to_string(_port), net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());
    if (stopped()) co_return stopped_failure();

    co_await stream.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());
    if (stopped()) co_return stopped_failure();

    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());
    if (stopped()) co_return stopped_failure();

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;

    co_await http::async_read(stream, buffer, res, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());

    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);

    // not_connected is fine here, the server may already have closed
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    if (stopped()) co_return stopped_failure();

    co_return evaluate(res, latency);
}
