#ifndef DICE_ROUND_HPP
#define DICE_ROUND_HPP

#include "dice/die.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace dice {

enum class Verdict
{
   PLAYER_WINS,
   HOUSE_WINS,
   TIE,
};

struct RoundResult
{
   int32_t playerFace;
   int32_t houseFace;
   Verdict verdict;
};

RoundResult ResolveRound(int32_t playerFace, int32_t houseFace) noexcept;

// The house takes the first die in the set other than the player's pick. The rule does not
// depend on who won the first move.
size_t SelectRemainingDie(const DiceSet & dice, size_t chosen);

std::string_view ToString(Verdict verdict);

} // namespace dice

#endif // DICE_ROUND_HPP
