#pragma once

#include "BaseProbe.hpp"

#include <string>

// Stands in for a provider URL no transport can reach. Every call fails with
// ConnectionFailed, so the provider is simply never selected.
class UnsupportedProbe : public BaseProbe {
public:
    UnsupportedProbe(boost::asio::any_io_executor exec, std::string_view provider_url, std::string reason);

    boost::asio::awaitable<ProbeResponse> async_probe() override;

    const std::string& reason() const { return _reason; }

private:
    std::string _reason;
};
