#include "Scheduler.hpp"
#include "Log.hpp"

Scheduler::Scheduler(boost::asio::any_io_executor exec, std::chrono::microseconds interval, RoundFn round):
    _strand(boost::asio::make_strand(exec)),
    _interval(interval),
    _round(std::move(round)),
    _timer(_strand)
    {}

void Scheduler::start() {
    auto self = shared_from_this();

    boost::asio::co_spawn(_strand,
        [self]() -> boost::asio::awaitable<void> {
            co_await self->run();
        },
        boost::asio::bind_cancellation_slot(_cancel.slot(), [](std::exception_ptr e) {
            if (!e) return;

            try { std::rethrow_exception(e); }
            catch (const boost::system::system_error& ex) {
                if (ex.code() != boost::asio::error::operation_aborted) log_error("scheduler stopped unexpectedly: {}", ex.what());
            }
            catch (const std::exception& ex) { log_error("scheduler stopped unexpectedly: {}", ex.what()); }
        })
    );
}

void Scheduler::stop() {
    if (_stopped.exchange(true, std::memory_order_acq_rel)) return;

    // the timer and the signal belong to the strand
    boost::asio::dispatch(_strand, [self = shared_from_this()] {
        self->_timer.cancel();
        self->_cancel.emit(boost::asio::cancellation_type::terminal);
    });
}

boost::asio::awaitable<void> Scheduler::run() {
    log_debug("scheduler started interval_us={}", _interval.count());

    while (!_stopped.load(std::memory_order_acquire)) {
        try {
            co_await _round();
        }
        catch (const boost::system::system_error& e) {
            if (e.code() == boost::asio::error::operation_aborted) break;
            log_error("round failed: {}", e.what());
        }
        catch (const std::exception& e) {
            log_error("round failed: {}", e.what());
        }

        if (_stopped.load(std::memory_order_acquire)) break;

        // rounds never overlap, the next timer starts only once this round is published
        boost::system::error_code ec;
        _timer.expires_after(_interval);
        co_await _timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) break;
    }

    log_debug("scheduler stopped");
}
