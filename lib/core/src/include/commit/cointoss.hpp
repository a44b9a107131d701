#ifndef COMMIT_COINTOSS_HPP
#define COMMIT_COINTOSS_HPP

#include "commit/commitment.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace commit {

// Commit/reveal agreement on a value in [0, range):
// the tag is public from the start, the counterparty guesses, then the secret is revealed.
//
//   AWAITING_GUESS --Guess()--> RESOLVED
//   AWAITING_GUESS --Abort()--> TERMINATED
class CoinToss
{
public:
   enum class Phase
   {
      AWAITING_GUESS,
      RESOLVED,
      TERMINATED,
   };

   explicit CoinToss(uint32_t range);

   Phase GetPhase() const noexcept { return m_phase; }
   uint32_t GetRange() const noexcept { return m_commitment.GetRange(); }
   const Tag & GetTag() const noexcept { return m_commitment.GetTag(); }

   // Returns whether the guess hit the committed value
   bool Guess(uint32_t guess);
   void Abort();

   // Available once RESOLVED
   const Disclosure & Reveal() const;
   std::optional<bool> GetOutcome() const noexcept;

private:
   Commitment m_commitment;
   Phase m_phase;
   std::optional<Disclosure> m_disclosure;
   std::optional<bool> m_outcome;
};

std::string_view ToString(CoinToss::Phase phase);

} // namespace commit

#endif // COMMIT_COINTOSS_HPP
