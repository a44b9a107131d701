#ifndef FSM_STATENEGOTIATING_HPP
#define FSM_STATENEGOTIATING_HPP

#include "commit/cointoss.hpp"
#include "fsm/context.hpp"
#include "fsm/statebase.hpp"

#include "utils/task.hpp"

#include <cstdint>

namespace fsm {

// Decides who moves first: the house commits to a value, the player guesses it
class StateNegotiating : public StateBase
{
public:
   static constexpr uint32_t FIRST_MOVE_RANGE = 2U;

   explicit StateNegotiating(const Context & ctx);
   ~StateNegotiating() override;

private:
   [[nodiscard]] cr::TaskHandle<void> Negotiate();
   void ShowMenu();

   Context m_ctx;
   commit::CoinToss m_toss;
};

} // namespace fsm

#endif
