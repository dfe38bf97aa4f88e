#ifndef FRAGXFER_PACER_HPP
#define FRAGXFER_PACER_HPP

#include <asio/io_context.hpp>
#include <chrono>

#include "deadline.hpp"

// Waits between retries and batches. Never waits past the deadline.
class Pacer {
public:
    virtual ~Pacer() = default;

    // Throws TimeoutError if the deadline would pass before the delay ends.
    virtual void pause(std::chrono::milliseconds delay, const Deadline& deadline) = 0;
};

// Blocks the calling thread on an asio steady_timer. Safe to share between threads.
class TimerPacer : public Pacer {
public:
    void pause(std::chrono::milliseconds delay, const Deadline& deadline) override;

private:
    asio::io_context io_context_;
};

#endif // FRAGXFER_PACER_HPP
