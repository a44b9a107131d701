#include "ctrl/displayadapter.hpp"

#include "utils/log.hpp"

namespace core {
namespace {
constexpr auto TAG = "Display";
}

void DisplayAdapter::Prompt(std::string_view text)
{
   Log::Debug(TAG, ">>>>> {}", text);
   m_display->ShowPrompt(text);
}

void DisplayAdapter::ShowLine(std::string_view text)
{
   Log::Debug(TAG, ">>>>> {}", text);
   m_display->ShowLine(text);
}

} // namespace core
