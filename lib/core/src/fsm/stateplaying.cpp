#include "fsm/stateplaying.hpp"

#include "dice/engine.hpp"
#include "dice/round.hpp"

#include "utils/log.hpp"

namespace fsm {

namespace {
constexpr auto TAG = "FSM";
}

StatePlaying::StatePlaying(const Context & ctx,
                           bool playerFirst,
                           size_t playerDie,
                           size_t houseDie)
   : m_ctx(ctx)
   , m_playerDie(playerDie)
   , m_houseDie(houseDie)
{
   Log::Info(TAG, "New state: {}", __func__);

   int32_t playerFace = 0;
   int32_t houseFace = 0;
   if (playerFirst) {
      playerFace = ThrowForPlayer();
      houseFace = ThrowForHouse();
   } else {
      houseFace = ThrowForHouse();
      playerFace = ThrowForPlayer();
   }

   const dice::RoundResult result = dice::ResolveRound(playerFace, houseFace);
   switch (result.verdict) {
   case dice::Verdict::PLAYER_WINS:
      m_ctx.display.Show("You win ({} > {})!", playerFace, houseFace);
      break;
   case dice::Verdict::HOUSE_WINS:
      m_ctx.display.Show("I win ({} > {})!", houseFace, playerFace);
      break;
   case dice::Verdict::TIE:
      m_ctx.display.Show("It's a tie ({} = {})!", playerFace, houseFace);
      break;
   }
   Log::Info(TAG, "Round over: {}", dice::ToString(result.verdict));
   Context::Finish(m_ctx, result);
}

StatePlaying::~StatePlaying() = default;

int32_t StatePlaying::ThrowForPlayer()
{
   m_ctx.display.Show("It's your turn!");
   const int32_t face = (*m_ctx.dice)[m_playerDie].Roll(*m_ctx.generator);
   m_ctx.display.Show("Your throw: {}.", face);
   return face;
}

int32_t StatePlaying::ThrowForHouse()
{
   m_ctx.display.Show("It's my turn!");
   const int32_t face = (*m_ctx.dice)[m_houseDie].Roll(*m_ctx.generator);
   m_ctx.display.Show("My throw: {}.", face);
   return face;
}

} // namespace fsm
