#pragma once

#include "BaseProbe.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

class HttpsProbe : public BaseProbe {
public:
    HttpsProbe(boost::asio::any_io_executor exec, std::string_view provider_url, std::string_view rpc_method): BaseProbe(exec, provider_url, rpc_method), _ssl_ctx(boost::asio::ssl::context::tlsv12_client) {
        _ssl_ctx.set_default_verify_paths();
        _ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);
    }

    ~HttpsProbe() = default;

    boost::asio::awaitable<ProbeResponse> async_probe() override;

private:
    boost::asio::ssl::context _ssl_ctx;
};
