#include "consoledisplay.hpp"

#include <string_view>

namespace cli {
namespace {

class ConsoleDisplay : public ui::IDisplay
{
public:
   explicit ConsoleDisplay(FILE * out)
      : m_out(out)
   {}

private:
   void ShowLine(std::string_view text) override
   {
      std::fwrite(text.data(), 1, text.size(), m_out);
      std::fputc('\n', m_out);
      std::fflush(m_out);
   }
   void ShowPrompt(std::string_view text) override
   {
      std::fwrite(text.data(), 1, text.size(), m_out);
      std::fflush(m_out);
   }

   FILE * const m_out;
};

} // namespace

std::unique_ptr<ui::IDisplay> CreateConsoleDisplay(FILE * out)
{
   return std::make_unique<ConsoleDisplay>(out);
}

} // namespace cli
