#pragma once

#include <memory>
#include <functional>
#include <string_view>

#include <boost/asio.hpp>

class BaseProbe;

using ProbeFactory = std::function<std::shared_ptr<BaseProbe>(boost::asio::any_io_executor exec, std::string_view url, std::string_view rpc_method)>;

// http and https URLs get a real transport, anything else a probe that always fails
std::shared_ptr<BaseProbe> make_probe(boost::asio::any_io_executor exec, std::string_view url, std::string_view rpc_method);
