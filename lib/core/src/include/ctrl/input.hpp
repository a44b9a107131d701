#ifndef CORE_INPUT_HPP
#define CORE_INPUT_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace core {
namespace input {

struct Exit final
{
   static constexpr std::string_view KEY = "x";
};

struct Help final
{
   static constexpr std::string_view KEY = "?";
};

struct Choice final
{
   uint32_t index;
};

// Anything else. The prompt is repeated, nothing advances.
struct Invalid final
{};

} // namespace input

using Input = std::variant<input::Invalid, input::Exit, input::Help, input::Choice>;

// Control keys are case-insensitive, surrounding blanks are ignored.
// A choice must be a plain decimal number below optionCount.
Input ParseInput(std::string_view line, uint32_t optionCount);

} // namespace core

#endif // CORE_INPUT_HPP
