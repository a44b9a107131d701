#ifndef TASK_OWNER_HPP
#define TASK_OWNER_HPP

#include "utils/task.hpp"

#include <vector>

namespace cr {

// Keeps root tasks alive for as long as the owner lives, cancels them when it dies.
class TaskOwner
{
public:
   void StartTask(TaskHandle<void> && task)
   {
      RethrowExceptions();
      std::erase_if(m_tasks, [](const TaskHandle<void> & t) {
         return !t;
      });
      m_tasks.emplace_back(std::move(task));
      m_tasks.back().Run();
   }

   void RethrowExceptions()
   {
      for (auto & task : m_tasks)
         task.EnsureNoException();
   }

   bool HasRunningTasks() const
   {
      for (const auto & task : m_tasks) {
         if (task)
            return true;
      }
      return false;
   }

private:
   std::vector<TaskHandle<void>> m_tasks;
};

} // namespace cr

#endif
