#include "dice/round.hpp"

#include <stdexcept>

namespace dice {

RoundResult ResolveRound(int32_t playerFace, int32_t houseFace) noexcept
{
   Verdict verdict = Verdict::TIE;
   if (playerFace > houseFace)
      verdict = Verdict::PLAYER_WINS;
   else if (playerFace < houseFace)
      verdict = Verdict::HOUSE_WINS;
   return RoundResult{playerFace, houseFace, verdict};
}

size_t SelectRemainingDie(const DiceSet & dice, size_t chosen)
{
   if (chosen >= dice.size())
      throw std::out_of_range("Chosen die is not in the set");
   for (size_t i = 0; i < dice.size(); ++i) {
      if (i != chosen)
         return i;
   }
   throw std::invalid_argument("No die left for the house");
}

std::string_view ToString(Verdict verdict)
{
#define CASE(name) case Verdict::name: return #name
   switch (verdict) {
   CASE(PLAYER_WINS);
   CASE(HOUSE_WINS);
   CASE(TIE);
   }
#undef CASE
   return "Unknown";
}

} // namespace dice
