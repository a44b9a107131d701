#ifndef FSM_STATEPLAYING_HPP
#define FSM_STATEPLAYING_HPP

#include "fsm/context.hpp"
#include "fsm/statebase.hpp"

#include <cstddef>
#include <cstdint>

namespace fsm {

// Both sides throw once, whoever won the first move throws first
class StatePlaying : public StateBase
{
public:
   StatePlaying(const Context & ctx, bool playerFirst, size_t playerDie, size_t houseDie);
   ~StatePlaying() override;

private:
   int32_t ThrowForPlayer();
   int32_t ThrowForHouse();

   Context m_ctx;
   const size_t m_playerDie;
   const size_t m_houseDie;
};

} // namespace fsm

#endif
