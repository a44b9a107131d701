#include "ctrl/timer.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std::chrono_literals;

namespace core {

struct Timer::FutureTimeout
{
   FutureTimeout(const Timer & timer, std::chrono::milliseconds timeout)
      : m_timer(timer)
      , m_timeout(std::max(0ms, timeout))
   {}
   bool await_ready() const noexcept { return false; }
   void await_suspend(stdcr::coroutine_handle<> h) const
   {
      if (!m_timer.m_scheduler)
         throw std::logic_error("Timer has no scheduler");
      m_timer.m_scheduler(h, m_timeout);
   }
   Timeout await_resume() const noexcept { return {}; }

private:
   const Timer & m_timer;
   const std::chrono::milliseconds m_timeout;
};


cr::TaskHandle<Timeout> Timer::WaitFor(std::chrono::milliseconds delay)
{
   co_return co_await FutureTimeout(*this, delay);
}

} // namespace core
