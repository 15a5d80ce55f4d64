// SPDX-License-Identifier: Apache-2.0
#include "CallExecutor.hpp"

#include <condition_variable>
#include <mutex>

namespace mcphub
{

CallDeadline::CallDeadline(std::chrono::milliseconds timeout, std::stop_source source)
{
    if (timeout <= std::chrono::milliseconds::zero())
        return;

    _timer = std::jthread([this, timeout, source = std::move(source)](std::stop_token stopToken) mutable {
        auto mutex = std::mutex {};
        auto cv = std::condition_variable_any {};
        auto lock = std::unique_lock { mutex };
        (void) cv.wait_for(lock, stopToken, timeout, [] { return false; });
        if (stopToken.stop_requested())
            return;
        _expired = true;
        source.request_stop();
    });
}

CallDeadline::~CallDeadline()
{
    if (_timer.joinable())
    {
        _timer.request_stop();
        _timer.join();
    }
}

} // namespace mcphub
