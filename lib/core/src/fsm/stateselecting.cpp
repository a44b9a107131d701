#include "fsm/stateselecting.hpp"

#include "dice/round.hpp"
#include "fsm/prompt.hpp"
#include "fsm/stateplaying.hpp"

#include "utils/log.hpp"

namespace fsm {

namespace {
constexpr auto TAG = "FSM";
}

StateSelecting::StateSelecting(const Context & ctx, bool playerFirst)
   : m_ctx(ctx)
   , m_playerFirst(playerFirst)
{
   Log::Info(TAG, "New state: {}", __func__);
   m_ctx.display.Show("Choose your dice:");
   const dice::DiceSet & dice = *m_ctx.dice;
   for (size_t i = 0; i < dice.size(); ++i)
      m_ctx.display.Show("{} - {}", i, dice[i]);
   m_ctx.display.Show("X - exit");
   m_ctx.display.Show("? - help");
   StartTask(Select());
}

StateSelecting::~StateSelecting() = default;

cr::TaskHandle<void> StateSelecting::Select()
{
   const dice::DiceSet & dice = *m_ctx.dice;

   const std::optional<uint32_t> choice =
      co_await AwaitChoice(m_ctx,
                           static_cast<uint32_t>(dice.size()),
                           nullptr,
                           "Invalid selection. Please choose a valid dice index.");
   if (!choice) {
      m_ctx.display.Show("Goodbye!");
      Context::Finish(m_ctx, core::Aborted{});
      co_return;
   }

   const size_t playerDie = *choice;
   const size_t houseDie = dice::SelectRemainingDie(dice, playerDie);
   m_ctx.display.Show("You chose the [{}] dice.", dice[playerDie]);
   m_ctx.display.Show("I chose the [{}] dice.", dice[houseDie]);

   Context::SwitchToState<StatePlaying>(m_ctx, m_playerFirst, playerDie, houseDie);
}

} // namespace fsm
