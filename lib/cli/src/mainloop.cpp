#include "mainloop.hpp"

#include <thread>
#include <utility>

namespace cli {

void MainLoop::operator()(Task && task, std::chrono::milliseconds delay)
{
   m_tasks.emplace(Clock::now() + delay, std::move(task));
}

void MainLoop::RunUntilIdle()
{
   while (!m_tasks.empty()) {
      auto it = m_tasks.begin();
      if (it->first > Clock::now())
         std::this_thread::sleep_until(it->first);
      Task task = std::move(it->second);
      m_tasks.erase(it);
      task();
   }
}

} // namespace cli
