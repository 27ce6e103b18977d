#pragma once

#include <atomic>
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include <boost/url.hpp>
#include <boost/asio.hpp>
#include <boost/beast.hpp>

enum class ProbeError {
    Timeout,
    ConnectionFailed,
    BadStatus,
    MalformedResponse,
    RpcError,
    Cancelled
};

std::string_view to_string(ProbeError error);

struct ProbeResponse {
    std::optional<std::chrono::microseconds> latency = std::nullopt;
    std::optional<ProbeError> error = std::nullopt;
    std::string message;

    bool ok() const { return latency.has_value() && !error.has_value(); }
};

// one provider endpoint, a single round trip per async_probe() call
class BaseProbe {
public:
    BaseProbe(boost::asio::any_io_executor exec, std::string_view provider_url, std::string_view rpc_method = "web3_clientVersion");

    virtual ~BaseProbe() = default;

    // never throws for transport problems, the failure is carried in the response
    virtual boost::asio::awaitable<ProbeResponse> async_probe() = 0;

    const std::string_view url() const { return _raw_url; }

    // transport steps not yet started are skipped, the probe reports Cancelled
    void stop() { _stopped.store(true, std::memory_order_release); }
    bool stopped() const { return _stopped.load(std::memory_order_acquire); }

protected:
    struct Unchecked {};

    // keeps the URL as given, for probes that never go to the network
    BaseProbe(boost::asio::any_io_executor exec, std::string_view provider_url, Unchecked);

    boost::asio::any_io_executor _exec;

    std::string      _raw_url;
    boost::urls::url _url;
    std::string      _scheme;
    std::string      _host;
    uint16_t         _port;
    std::string      _target;
    std::string      _rpc_method;

    std::atomic<bool> _stopped{false};

    boost::beast::http::request<boost::beast::http::string_body> build_request() const;
    ProbeResponse evaluate(const boost::beast::http::response<boost::beast::http::string_body>& res, std::chrono::microseconds latency) const;

    static ProbeResponse failure(ProbeError error, std::string message) { return ProbeResponse{ std::nullopt, error, std::move(message) }; }
    static ProbeResponse stopped_failure() { return failure(ProbeError::Cancelled, "probe stopped"); }
};

// Error left after reading a response over TLS. A missing close_notify is
// dropped once the message is complete, or once the header is in and the
// body runs to the end of the connection.
boost::system::error_code settle_tls_read(boost::beast::http::response_parser<boost::beast::http::string_body>& parser, boost::system::error_code ec);
