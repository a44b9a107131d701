#ifndef FSM_CONTEXT_HPP
#define FSM_CONTEXT_HPP

#include "ctrl/displayadapter.hpp"
#include "ctrl/linereader.hpp"
#include "ctrl/outcome.hpp"
#include "ctrl/timer.hpp"
#include "dice/die.hpp"
#include "fsm/statebase.hpp"

#include "utils/task.hpp"

#include <memory>
#include <optional>
#include <typeinfo>

namespace dice {
class IEngine;
}

namespace fsm {

struct Context
{
   template <typename S, typename... Args>
   static cr::DetachedHandle SwitchToState(Context ctx, Args... args);

   // Records the terminal outcome and tears the current state down
   static void Finish(Context ctx, core::Outcome outcome);

   Context(dice::IEngine * generator,
           const dice::DiceSet * dice,
           core::Timer * timer,
           core::LineReader * input,
           core::DisplayAdapter display,
           std::optional<core::Outcome> * outcome,
           std::unique_ptr<StateBase> * stateHolder)
      : generator(generator)
      , dice(dice)
      , timer(timer)
      , input(input)
      , display(display)
      , outcome(*outcome)
      , stateHolder(*stateHolder)
   {}

   dice::IEngine * const generator;
   const dice::DiceSet * const dice;
   core::Timer * const timer;
   core::LineReader * const input;
   core::DisplayAdapter display;

private:
   std::optional<core::Outcome> & outcome;
   std::unique_ptr<StateBase> & stateHolder;
};

template <typename S, typename... Args>
inline cr::DetachedHandle Context::SwitchToState(Context ctx, Args... args)
{
   co_await ctx.timer->WaitFor(std::chrono::milliseconds(0));

   if (auto * state = ctx.stateHolder.get(); state && typeid(*state) == typeid(S))
      co_return;

   ctx.stateHolder.reset();
   ctx.stateHolder = std::make_unique<S>(ctx, std::move(args)...);
}

template <>
inline cr::DetachedHandle Context::SwitchToState<void>(Context ctx)
{
   co_await ctx.timer->WaitFor(std::chrono::milliseconds(0));
   ctx.stateHolder.reset();
}

inline void Context::Finish(Context ctx, core::Outcome outcome)
{
   if (!ctx.outcome)
      ctx.outcome = std::move(outcome);
   SwitchToState<void>(ctx);
}

} // namespace fsm

#endif // FSM_CONTEXT_HPP
