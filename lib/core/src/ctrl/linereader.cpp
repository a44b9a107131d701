#include "ctrl/linereader.hpp"

#include "utils/log.hpp"

#include <stdexcept>
#include <utility>

namespace core {
namespace {
constexpr auto TAG = "Input";
}

LineReader::FutureLine::FutureLine(LineReader & reader) noexcept
   : m_reader(reader)
{}

bool LineReader::FutureLine::await_ready() const noexcept
{
   return !m_reader.m_lines.empty();
}

void LineReader::FutureLine::await_suspend(stdcr::coroutine_handle<> h) const
{
   if (m_reader.m_waiter)
      throw std::logic_error("Only one coroutine may wait for input");
   m_reader.m_waiter = h;
}

std::string LineReader::FutureLine::await_resume() const
{
   if (m_reader.m_lines.empty())
      throw std::runtime_error("Input is closed");
   std::string line = std::move(m_reader.m_lines.front());
   m_reader.m_lines.pop_front();
   return line;
}

LineReader::~LineReader()
{
   // a waiter still parked here belongs to a canceled task, resuming lets it unwind
   if (auto waiter = std::exchange(m_waiter, nullptr))
      waiter.resume();
}

LineReader::FutureLine LineReader::ReadLine()
{
   return FutureLine(*this);
}

void LineReader::SubmitLine(std::string line)
{
   m_lines.push_back(std::move(line));
   if (auto waiter = std::exchange(m_waiter, nullptr)) {
      waiter.resume();
   } else {
      Log::Debug(TAG, "Queued a line, {} pending", m_lines.size());
   }
}

} // namespace core
