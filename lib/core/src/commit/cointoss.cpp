#include "commit/cointoss.hpp"

#include "utils/format.hpp"
#include "utils/log.hpp"

#include <stdexcept>

namespace commit {
namespace {
constexpr auto TAG = "Commit";
}

CoinToss::CoinToss(uint32_t range)
   : m_commitment(Commitment::Draw(range))
   , m_phase(Phase::AWAITING_GUESS)
{
   Log::Debug(TAG, "Committed to a value in [0, {}), tag={}", range, fmt::Hex{GetTag()});
}

bool CoinToss::Guess(uint32_t guess)
{
   if (m_phase != Phase::AWAITING_GUESS)
      throw std::logic_error(fmt::ToString("Cannot guess in phase {}", ToString(m_phase)));
   if (guess >= GetRange())
      throw std::out_of_range(
         fmt::ToString("Guess {} is outside of [0, {})", guess, GetRange()));

   m_disclosure = m_commitment.Open();
   m_outcome = (guess == m_disclosure->value);
   m_phase = Phase::RESOLVED;
   return *m_outcome;
}

void CoinToss::Abort()
{
   if (m_phase != Phase::AWAITING_GUESS)
      throw std::logic_error(fmt::ToString("Cannot abort in phase {}", ToString(m_phase)));
   m_phase = Phase::TERMINATED;
}

const Disclosure & CoinToss::Reveal() const
{
   if (m_phase != Phase::RESOLVED || !m_disclosure)
      throw std::logic_error(fmt::ToString("Cannot reveal in phase {}", ToString(m_phase)));
   return *m_disclosure;
}

std::optional<bool> CoinToss::GetOutcome() const noexcept
{
   return m_outcome;
}

std::string_view ToString(CoinToss::Phase phase)
{
#define CASE(name) case CoinToss::Phase::name: return #name
   switch (phase) {
   CASE(AWAITING_GUESS);
   CASE(RESOLVED);
   CASE(TERMINATED);
   }
#undef CASE
   return "Unknown";
}

} // namespace commit
