#ifndef DICE_CONFIG_HPP
#define DICE_CONFIG_HPP

#include "dice/die.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dice {

// Malformed or insufficient dice configuration. Fatal, raised before any game state exists.
class ConfigurationError : public std::invalid_argument
{
public:
   using std::invalid_argument::invalid_argument;
};

// "2,2,4,4,9,9" -> Die. Blanks around a face are ignored.
Die ParseDie(std::string_view token);

// One token per die, at least MIN_DICE of them
DiceSet ParseDiceSet(const std::vector<std::string> & tokens);

} // namespace dice

#endif // DICE_CONFIG_HPP
