#include "common/pacer.hpp"
#include "common/errors.hpp"

#include <asio/steady_timer.hpp>
#include <asio/system_error.hpp>

void TimerPacer::pause(std::chrono::milliseconds delay, const Deadline& deadline) {
    if (deadline.expired()) {
        throw TimeoutError("deadline expired");
    }
    if (delay.count() <= 0) return;
    if (deadline.remaining() <= delay) {
        throw TimeoutError("deadline expires within the next " + std::to_string(delay.count()) + " ms wait");
    }

    asio::steady_timer timer(io_context_, delay);
    asio::error_code ec;
    timer.wait(ec);
    if (ec) {
        throw asio::system_error(ec);
    }
}
