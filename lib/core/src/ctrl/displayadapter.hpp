#ifndef CORE_DISPLAYADAPTER_HPP
#define CORE_DISPLAYADAPTER_HPP

#include "ui/display.hpp"
#include "utils/format.hpp"

#include <string_view>

namespace core {

class DisplayAdapter
{
public:
   explicit DisplayAdapter(ui::IDisplay & display)
      : m_display(&display)
   {}

   template <fmt::Formattable... Ts>
   void Show(std::string_view fmt, const Ts &... args)
   {
      ShowLine(fmt::ToString(fmt, args...));
   }

   void Prompt(std::string_view text);

private:
   void ShowLine(std::string_view text);

   ui::IDisplay * m_display;
};

} // namespace core

#endif
