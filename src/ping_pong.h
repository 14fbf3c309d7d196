// ============================================================================
// ping_pong.h — two named buffer slots with an explicit front selector
//
// One slot is read (back) while the other is written (front).  flip()
// swaps the roles; the slots themselves never move, so handles taken from
// them stay valid across flips.
// ============================================================================
#pragma once

#include <utility>

template <typename T>
class PingPong {
public:
    PingPong() = default;
    PingPong(T first, T second) : slots_{std::move(first), std::move(second)} {}

    T&       front()       { return slots_[frontIndex_]; }
    const T& front() const { return slots_[frontIndex_]; }
    T&       back()        { return slots_[1 - frontIndex_]; }
    const T& back()  const { return slots_[1 - frontIndex_]; }

    T&       slot(int i)       { return slots_[i]; }
    const T& slot(int i) const { return slots_[i]; }

    int frontIndex() const { return frontIndex_; }
    int backIndex()  const { return 1 - frontIndex_; }

    void flip() { frontIndex_ = 1 - frontIndex_; }

private:
    T   slots_[2]{};
    int frontIndex_ = 0;
};
