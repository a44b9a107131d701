#ifndef FSM_STATESELECTING_HPP
#define FSM_STATESELECTING_HPP

#include "fsm/context.hpp"
#include "fsm/statebase.hpp"

#include "utils/task.hpp"

namespace fsm {

// The player picks a die, the house takes the first remaining one
class StateSelecting : public StateBase
{
public:
   StateSelecting(const Context & ctx, bool playerFirst);
   ~StateSelecting() override;

private:
   [[nodiscard]] cr::TaskHandle<void> Select();

   Context m_ctx;
   const bool m_playerFirst;
};

} // namespace fsm

#endif
