#ifndef DICE_PROBABILITY_HPP
#define DICE_PROBABILITY_HPP

#include "dice/die.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dice {

inline constexpr std::string_view NOT_APPLICABLE = "-";

// cell[i][j]: chance that die i shows a strictly higher face than die j, as "55.56%".
// The diagonal holds NOT_APPLICABLE. Ties count for neither side.
using ProbabilityMatrix = std::vector<std::vector<std::string>>;

// Number of the FACE_COUNT * FACE_COUNT equally likely pairings that `a` wins
size_t CountWins(const Die & a, const Die & b) noexcept;

double WinProbability(const Die & a, const Die & b) noexcept;

ProbabilityMatrix CalculateProbabilities(const DiceSet & dice);

} // namespace dice

#endif // DICE_PROBABILITY_HPP
