#include "fsm/statenegotiating.hpp"

#include "fsm/prompt.hpp"
#include "fsm/stateselecting.hpp"

#include "utils/log.hpp"

namespace fsm {

namespace {
constexpr auto TAG = "FSM";
}

StateNegotiating::StateNegotiating(const Context & ctx)
   : m_ctx(ctx)
   , m_toss(FIRST_MOVE_RANGE)
{
   Log::Info(TAG, "New state: {}", __func__);
   m_ctx.display.Show("I selected a random value in the range 0..{} (HMAC={}).",
                      m_toss.GetRange() - 1,
                      fmt::Hex{m_toss.GetTag()});
   StartTask(Negotiate());
}

StateNegotiating::~StateNegotiating() = default;

void StateNegotiating::ShowMenu()
{
   m_ctx.display.Show("Try to guess my selection.");
   for (uint32_t i = 0; i < m_toss.GetRange(); ++i)
      m_ctx.display.Show("{} - {}", i, i);
   m_ctx.display.Show("X - exit");
   m_ctx.display.Show("? - help");
}

cr::TaskHandle<void> StateNegotiating::Negotiate()
{
   const std::optional<uint32_t> guess = co_await AwaitChoice(
      m_ctx,
      m_toss.GetRange(),
      [this] {
         ShowMenu();
      },
      fmt::ToString("Invalid input. Please choose a number from 0 to {}.", m_toss.GetRange() - 1));

   if (!guess) {
      m_toss.Abort();
      m_ctx.display.Show("Goodbye!");
      Context::Finish(m_ctx, core::Aborted{});
      co_return;
   }

   const bool playerFirst = m_toss.Guess(*guess);
   const commit::Disclosure & disclosure = m_toss.Reveal();
   m_ctx.display.Show("My selection: {} (KEY={}).", disclosure.value, fmt::Hex{disclosure.key});

   if (commit::VerifyCommitment(commit::ToHex(m_toss.GetTag()),
                                commit::ToHex(disclosure.key),
                                disclosure.value))
      Log::Info(TAG, "Reveal matches the commitment");
   else
      Log::Error(TAG, "Reveal does not match the commitment");

   m_ctx.display.Show(playerFirst ? "You make the first move!" : "I make the first move!");
   Context::SwitchToState<StateSelecting>(m_ctx, playerFirst);
}

} // namespace fsm
