#include "UnsupportedProbe.hpp"

UnsupportedProbe::UnsupportedProbe(boost::asio::any_io_executor exec, std::string_view provider_url, std::string reason):
    BaseProbe(exec, provider_url, Unchecked{}),
    _reason(std::move(reason))
    {}

boost::asio::awaitable<ProbeResponse> UnsupportedProbe::async_probe() {
    if (stopped()) co_return stopped_failure();
    co_return failure(ProbeError::ConnectionFailed, _reason);
}
