#pragma once

#include "BaseProbe.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

// plain http:// endpoints, mostly local or private nodes
class HttpProbe : public BaseProbe {
public:
    HttpProbe(boost::asio::any_io_executor exec, std::string_view provider_url, std::string_view rpc_method): BaseProbe(exec, provider_url, rpc_method) {}

    ~HttpProbe() = default;

    boost::asio::awaitable<ProbeResponse> async_probe() override;
};
