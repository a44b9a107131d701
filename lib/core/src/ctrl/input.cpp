#include "ctrl/input.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace core {
namespace {

std::string_view Trim(std::string_view s)
{
   while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
      s.remove_prefix(1);
   while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
      s.remove_suffix(1);
   return s;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
   return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) ==
             std::tolower(static_cast<unsigned char>(b));
   });
}

} // namespace

Input ParseInput(std::string_view line, uint32_t optionCount)
{
   line = Trim(line);

   if (EqualsIgnoreCase(line, input::Exit::KEY))
      return input::Exit{};
   if (EqualsIgnoreCase(line, input::Help::KEY))
      return input::Help{};

   uint32_t index = 0;
   const auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), index);
   if (line.empty() || ec != std::errc{} || ptr != line.data() + line.size())
      return input::Invalid{};
   if (index >= optionCount)
      return input::Invalid{};
   return input::Choice{index};
}

} // namespace core
