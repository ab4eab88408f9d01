#include "PollPolicy.h"
#include <thread>

namespace alipay
{
void PollPolicy::wait() const
{
    if (sleeper)
    {
        sleeper(interval);
        return;
    }
    std::this_thread::sleep_for(interval);
}
}  // namespace alipay
