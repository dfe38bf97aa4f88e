#ifndef FRAGXFER_DEADLINE_HPP
#define FRAGXFER_DEADLINE_HPP

#include <chrono>

// A point on the steady clock after which work must stop.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    // Budgets too large for the clock saturate to never(). The comparison is made in the
    // caller's unit because converting a huge budget to clock ticks would itself overflow.
    template <typename Rep, typename Period>
    static Deadline after(std::chrono::duration<Rep, Period> budget) {
        using budget_type = std::chrono::duration<Rep, Period>;
        const auto now = clock::now();
        const auto room = std::chrono::duration_cast<budget_type>(clock::time_point::max() - now);
        if (budget >= room) return never();
        return Deadline(now + std::chrono::duration_cast<clock::duration>(budget));
    }
    static Deadline never() { return Deadline(clock::time_point::max()); }

    // The effective deadline of two nested budgets is whichever ends first.
    Deadline earliest(const Deadline& other) const {
        return other.when_ < when_ ? other : *this;
    }

    bool expired() const { return clock::now() >= when_; }

    std::chrono::milliseconds remaining() const {
        auto now = clock::now();
        if (now >= when_) return std::chrono::milliseconds(0);
        if (when_ == clock::time_point::max()) return std::chrono::milliseconds::max();
        return std::chrono::duration_cast<std::chrono::milliseconds>(when_ - now);
    }

    clock::time_point when() const { return when_; }

private:
    explicit Deadline(clock::time_point when) : when_(when) {}

    clock::time_point when_;
};

#endif // FRAGXFER_DEADLINE_HPP
