#ifndef FRAGXFER_FRAGMENT_SOURCE_HPP
#define FRAGXFER_FRAGMENT_SOURCE_HPP

#include <optional>
#include <vector>

#include "manifest.hpp"

// A lazy, finite sequence of fragments in index order.
class FragmentSource {
public:
    virtual ~FragmentSource() = default;

    // Next fragment, or std::nullopt once the sequence is exhausted.
    virtual std::optional<Fragment> next() = 0;

    // Restarts the sequence from its first fragment.
    virtual void rewind() = 0;

    // Gives a consumed fragment back so its buffer can be reused.
    virtual void recycle(Fragment&& fragment) { fragment.bytes.clear(); }
};

// In-memory fragments. next() hands out copies so the list can be replayed.
class FragmentList : public FragmentSource {
public:
    FragmentList() = default;
    explicit FragmentList(std::vector<Fragment> fragments) : fragments_(std::move(fragments)) {}

    std::optional<Fragment> next() override {
        if (position_ >= fragments_.size()) return std::nullopt;
        return fragments_[position_++];
    }

    void rewind() override { position_ = 0; }

    size_t size() const { return fragments_.size(); }

private:
    std::vector<Fragment> fragments_;
    size_t position_ = 0;
};

#endif // FRAGXFER_FRAGMENT_SOURCE_HPP
