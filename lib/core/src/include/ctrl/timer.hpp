#ifndef TIMER_HPP
#define TIMER_HPP

#include "utils/task.hpp"

#include <chrono>
#include <functional>

namespace core {

struct Timeout
{};

// Suspends coroutines on an externally driven scheduler
class Timer
{
public:
   using Task = std::function<void()>;
   using Scheduler = std::function<void(Task &&, std::chrono::milliseconds)>;

   template <typename S>
   explicit Timer(S && scheduler)
      : m_scheduler(std::forward<S>(scheduler))
   {}

   cr::TaskHandle<Timeout> WaitFor(std::chrono::milliseconds delay);

private:
   struct FutureTimeout;

   const Scheduler m_scheduler;
};

} // namespace core

#endif
