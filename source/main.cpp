#include "ClosestProvider.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <print>
#include <csignal>
#include <string>
#include <vector>
#include <charconv>
#include <optional>
#include <string_view>

#include <boost/asio.hpp>

struct CliOptions {
    std::vector<std::string> urls;
    std::chrono::milliseconds interval{10000};
    BalancerOptions balancer;
    bool once = false;
};

static void print_usage() {
    std::println(stderr, "usage: closest-provider [--interval-ms N] [--timeout-fraction F] [--method NAME] [--once] [--quiet|--verbose] URL...");
}

template <typename T>
static bool parse_number(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

static std::optional<CliOptions> parse_args(int argc, char** argv) {
    CliOptions out;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string_view(argv[++i]);
        };

        if (arg == "--interval-ms") {
            auto value = next();
            long long ms{};
            if (!value || !parse_number(*value, ms)) return std::nullopt;
            out.interval = std::chrono::milliseconds(ms);
        }
        else if (arg == "--timeout-fraction") {
            auto value = next();
            if (!value || !parse_number(*value, out.balancer.probe_timeout_fraction)) return std::nullopt;
        }
        else if (arg == "--method") {
            auto value = next();
            if (!value) return std::nullopt;
            out.balancer.rpc_method = std::string(*value);
        }
        else if (arg == "--once") out.once = true;
        else if (arg == "--quiet") set_log_level(LogLevel::Error);
        else if (arg == "--verbose") set_log_level(LogLevel::Debug);
        else if (arg == "--help" || arg == "-h") return std::nullopt;
        else if (arg.starts_with("--")) return std::nullopt;
        else out.urls.emplace_back(arg);
    }

    return out;
}

// prints every new selection until the provider is destroyed
static boost::asio::awaitable<void> report_loop(ClosestProvider& provider, std::chrono::milliseconds interval, bool once) {
    co_await provider.async_wait_until_ready();

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    uint64_t last_generation = 0;

    while (!provider.is_destroyed()) {
        auto snap = provider.snapshot();

        if (!snap.fastest_url) std::println("no provider answered yet");
        else if (snap.generation != last_generation) {
            std::println("{} {}us", *snap.fastest_url, snap.fastest_latency->count());
            last_generation = snap.generation;

            if (once) {
                provider.destroy();
                break;
            }
        }

        boost::system::error_code ec;
        timer.expires_after(interval);
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) break;
    }
}

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);

    if (!options) {
        print_usage();
        return 2;
    }

    try {
        boost::asio::io_context ioc;

        auto provider = ClosestProvider::init(ioc.get_executor(), options->urls, options->interval, options->balancer);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            provider->destroy();
            ioc.stop();
        });

        boost::asio::co_spawn(ioc, report_loop(*provider, options->interval, options->once), [&](std::exception_ptr e) {
            signals.cancel();
            if (e) std::rethrow_exception(e);
        });

        ioc.run();
    }

    catch (const ConfigurationError& ex) {
        std::println(stderr, "{}", ex.what());
        return 2;
    }

    catch (const std::exception& ex) {
        std::println(stderr, "{}", ex.what());
        return 1;
    }
}
