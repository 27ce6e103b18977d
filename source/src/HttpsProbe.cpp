#include "HttpsProbe.hpp"

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

boost::asio::awaitable<ProbeResponse> HttpsProbe::async_probe() {
    if (stopped()) co_return stopped_failure();

    auto executor = co_await net::this_coro::executor;
    boost::system::error_code ec;

    tcp::resolver resolver(executor);

    ssl::stream<tcp::socket> stream(executor, _ssl_ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), _host.c_str())) {
        co_return failure(ProbeError::ConnectionFailed, "Could not set SNI host name");
    }

    stream.set_verify_callback(ssl::host_name_verification(_host));

    auto req = build_request();
    auto start = std::chrono::steady_clock::now();

    auto results = co_await resolver.async_resolve(_host, std::to_string(_port), net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());
    if (stopped()) co_return stopped_failure();

    co_await net::async_connect(stream.next_layer(), results, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());
    if (stopped()) co_return stopped_failure();

    co_await stream.async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());
    if (stopped()) co_return stopped_failure();

    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());
    if (stopped()) co_return stopped_failure();

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;

    co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));

    // some providers close the stream without a close_notify
    ec = settle_tls_read(parser, ec);
    if (ec) co_return failure(ProbeError::ConnectionFailed, ec.message());

    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);

    // no close_notify exchange, waiting on it would count against the probe timeout
    stream.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    stream.next_layer().close(ec);

    if (stopped()) co_return stopped_failure();

    co_return evaluate(parser.get(), latency);
}
