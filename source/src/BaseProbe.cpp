#include "BaseProbe.hpp"
#include "Errors.hpp"

#include <format>
#include <charconv>

#include <boost/json.hpp>
#include <boost/asio/ssl/error.hpp>

namespace http = boost::beast::http;

std::string_view to_string(ProbeError error) {
    switch (error) {
        case ProbeError::Timeout:           return "timeout";
        case ProbeError::ConnectionFailed:  return "connection_failed";
        case ProbeError::BadStatus:         return "bad_status";
        case ProbeError::MalformedResponse: return "malformed_response";
        case ProbeError::RpcError:          return "rpc_error";
        case ProbeError::Cancelled:         return "cancelled";
    }
    return "unknown";
}

BaseProbe::BaseProbe(boost::asio::any_io_executor exec, std::string_view provider_url, std::string_view rpc_method)
    : _exec(exec), _raw_url(provider_url), _rpc_method(rpc_method)
{
    auto rv = boost::urls::parse_uri(_raw_url);
    if (!rv) throw ConfigurationError("Invalid provider URL: " + _raw_url);

    _url = *rv;

    _scheme = std::string(_url.scheme());
    _host   = std::string(_url.host_address());

    if (!_url.has_port() || _url.port().empty()) {
        _port = (_scheme == "https") ? 443 : 80;
    } else {
        auto port = _url.port();
        unsigned value{};
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);

        if (ec != std::errc{} || ptr != port.data() + port.size() || value > 65535)
            throw ConfigurationError("Invalid port in provider URL: " + _raw_url);

        _port = static_cast<uint16_t>(value);
    }

    auto target = _url.encoded_target();
    _target.assign(target.data(), target.size());
    if (_target.empty() || _target.front() != '/') _target.insert(_target.begin(), '/');
}

BaseProbe::BaseProbe(boost::asio::any_io_executor exec, std::string_view provider_url, Unchecked)
    : _exec(exec), _raw_url(provider_url), _port(0)
{}

http::request<http::string_body> BaseProbe::build_request() const {
    boost::json::object body;
    body["jsonrpc"] = "2.0";
    body["method"]  = _rpc_method;
    body["params"]  = boost::json::array{};
    body["id"]      = 1;

    http::request<http::string_body> req { http::verb::post, _target, 11 };
    auto authority = _url.encoded_host_and_port();
    req.set(http::field::host, std::string_view(authority.data(), authority.size()));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.body() = boost::json::serialize(body);
    req.prepare_payload();

    return req;
}

ProbeResponse BaseProbe::evaluate(const http::response<http::string_body>& res, std::chrono::microseconds latency) const {
    if (http::to_status_class(res.result()) != http::status_class::successful)
        return failure(ProbeError::BadStatus, std::format("HTTP {}", res.result_int()));

    boost::system::error_code ec;
    auto parsed = boost::json::parse(res.body(), ec);

    if (ec) return failure(ProbeError::MalformedResponse, ec.message());

    // a JSON-RPC error member means the node answered but refused the call
    if (const auto* obj = parsed.if_object()) {
        if (auto it = obj->find("error"); it != obj->end() && !it->value().is_null())
            return failure(ProbeError::RpcError, boost::json::serialize(it->value()));
    }

    return ProbeResponse{ latency, std::nullopt, {} };
}

boost::system::error_code settle_tls_read(http::response_parser<http::string_body>& parser, boost::system::error_code ec) {
    if (ec != boost::asio::ssl::error::stream_truncated || !parser.is_header_done()) return ec;
    if (parser.is_done()) return {};

    if (parser.need_eof()) {
        boost::system::error_code eof;
        parser.put_eof(eof);
        return eof;
    }

    return ec;
}
