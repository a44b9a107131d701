#ifndef CORE_LINEREADER_HPP
#define CORE_LINEREADER_HPP

#include "utils/coroutine.hpp"

#include <deque>
#include <string>

namespace core {

// Single suspension point for input: at most one coroutine waits for the next line.
// Lines that arrive while nobody waits are kept in arrival order.
class LineReader
{
public:
   struct FutureLine
   {
      explicit FutureLine(LineReader & reader) noexcept;
      bool await_ready() const noexcept;
      void await_suspend(stdcr::coroutine_handle<> h) const;
      std::string await_resume() const;

   private:
      LineReader & m_reader;
   };

   LineReader() = default;
   LineReader(const LineReader &) = delete;
   LineReader & operator=(const LineReader &) = delete;
   ~LineReader();

   FutureLine ReadLine();
   void SubmitLine(std::string line);
   bool IsWaiting() const noexcept { return static_cast<bool>(m_waiter); }

private:
   std::deque<std::string> m_lines;
   stdcr::coroutine_handle<> m_waiter = nullptr;
};

} // namespace core

#endif // CORE_LINEREADER_HPP
