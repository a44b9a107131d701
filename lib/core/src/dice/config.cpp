#include "dice/config.hpp"

#include "utils/format.hpp"

#include <charconv>
#include <optional>

namespace {

std::string_view Trim(std::string_view s)
{
   constexpr std::string_view blanks = " \t\r\n";
   const size_t first = s.find_first_not_of(blanks);
   if (first == std::string_view::npos)
      return {};
   const size_t last = s.find_last_not_of(blanks);
   return s.substr(first, last - first + 1);
}

std::optional<int32_t> ParseFace(std::string_view text)
{
   text = Trim(text);
   if (text.empty())
      return std::nullopt;
   int32_t value = 0;
   const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
   if (ec != std::errc{} || ptr != text.data() + text.size())
      return std::nullopt;
   return value;
}

} // namespace

namespace dice {

Die ParseDie(std::string_view token)
{
   Faces faces{};
   size_t count = 0;
   std::string_view rest = token;

   for (;;) {
      const size_t comma = rest.find(',');
      const std::string_view piece = rest.substr(0, comma);

      if (count == FACE_COUNT)
         throw ConfigurationError(fmt::ToString(
            "Invalid dice configuration '{}': each die must have exactly {} integer faces.",
            token,
            FACE_COUNT));

      auto face = ParseFace(piece);
      if (!face)
         throw ConfigurationError(
            fmt::ToString("Invalid dice configuration '{}': '{}' is not an integer.",
                          token,
                          Trim(piece)));
      faces[count++] = *face;

      if (comma == std::string_view::npos)
         break;
      rest.remove_prefix(comma + 1);
   }

   if (count != FACE_COUNT)
      throw ConfigurationError(fmt::ToString(
         "Invalid dice configuration '{}': each die must have exactly {} integer faces.",
         token,
         FACE_COUNT));

   return Die(faces);
}

DiceSet ParseDiceSet(const std::vector<std::string> & tokens)
{
   if (tokens.size() < MIN_DICE)
      throw ConfigurationError(
         fmt::ToString("At least {} dice configurations are required, got {}.",
                       MIN_DICE,
                       tokens.size()));

   DiceSet dice;
   dice.reserve(tokens.size());
   for (const auto & token : tokens)
      dice.push_back(ParseDie(token));
   return dice;
}

} // namespace dice
