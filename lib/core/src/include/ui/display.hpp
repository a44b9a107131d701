#ifndef UI_DISPLAY_HPP
#define UI_DISPLAY_HPP

#include <string_view>

namespace ui {

// Where the session writes its side of the conversation
class IDisplay
{
public:
   virtual ~IDisplay() = default;
   virtual void ShowLine(std::string_view text) = 0;
   // Text without a line break, the player answers on the same line
   virtual void ShowPrompt(std::string_view text) = 0;
};

} // namespace ui

#endif // UI_DISPLAY_HPP
