#include "dice/probability.hpp"

#include "utils/format.hpp"

namespace dice {

size_t CountWins(const Die & a, const Die & b) noexcept
{
   size_t wins = 0;
   for (int32_t faceA : a.GetFaces()) {
      for (int32_t faceB : b.GetFaces()) {
         if (faceA > faceB)
            ++wins;
      }
   }
   return wins;
}

double WinProbability(const Die & a, const Die & b) noexcept
{
   constexpr size_t pairings = FACE_COUNT * FACE_COUNT;
   return static_cast<double>(CountWins(a, b)) / static_cast<double>(pairings);
}

ProbabilityMatrix CalculateProbabilities(const DiceSet & dice)
{
   ProbabilityMatrix matrix(dice.size());
   for (size_t i = 0; i < dice.size(); ++i) {
      matrix[i].reserve(dice.size());
      for (size_t j = 0; j < dice.size(); ++j) {
         if (i == j)
            matrix[i].emplace_back(NOT_APPLICABLE);
         else
            matrix[i].push_back(
               fmt::ToString("{}%", fmt::Fixed{100.0 * WinProbability(dice[i], dice[j]), 2}));
      }
   }
   return matrix;
}

} // namespace dice
