#pragma once

#include <chrono>
#include <functional>

namespace alipay
{
struct PollPolicy
{
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    int maxAttempts{5};
    std::chrono::milliseconds interval{std::chrono::seconds(5)};
    // Blocks the calling thread; std::this_thread::sleep_for when unset.
    Sleeper sleeper;

    void wait() const;
};
}  // namespace alipay
