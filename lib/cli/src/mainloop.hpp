#ifndef CLI_MAINLOOP_HPP
#define CLI_MAINLOOP_HPP

#include <chrono>
#include <functional>
#include <map>

namespace cli {

// Single-threaded scheduler behind core::Timer
class MainLoop
{
public:
   using Task = std::function<void()>;
   using Clock = std::chrono::steady_clock;

   void operator()(Task && task, std::chrono::milliseconds delay);

   // Runs scheduled tasks, including the ones they schedule, until none is left
   void RunUntilIdle();

private:
   std::multimap<Clock::time_point, Task> m_tasks;
};

} // namespace cli

#endif // CLI_MAINLOOP_HPP
