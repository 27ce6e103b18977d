#include "ProbeFactory.hpp"
#include "HttpProbe.hpp"
#include "HttpsProbe.hpp"
#include "UnsupportedProbe.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <string>

std::shared_ptr<BaseProbe> make_probe(boost::asio::any_io_executor exec, std::string_view url, std::string_view rpc_method) {
    std::string reason = "unsupported scheme";

    try {
        if (url.starts_with("https://")) return std::make_shared<HttpsProbe>(exec, url, rpc_method);
        else if (url.starts_with("http://")) return std::make_shared<HttpProbe>(exec, url, rpc_method);
    }
    catch (const ConfigurationError& e) {
        reason = e.what();
    }

    log_warn("provider cannot be probed url={} reason={}", url, reason);
    return std::make_shared<UnsupportedProbe>(exec, url, std::move(reason));
}
