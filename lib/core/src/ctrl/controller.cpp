#include "ctrl/controller.hpp"
#include "ctrl/displayadapter.hpp"
#include "ctrl/linereader.hpp"
#include "ctrl/timer.hpp"
#include "dice/engine.hpp"
#include "fsm/context.hpp"
#include "fsm/statebase.hpp"
#include "fsm/statenegotiating.hpp"
#include "ui/display.hpp"

#include "utils/log.hpp"

#include <utility>

namespace {

constexpr auto TAG = "Input";

class Controller : public core::IController
{
public:
   Controller(std::unique_ptr<dice::IEngine> engine,
              std::unique_ptr<core::Timer> timer,
              dice::DiceSet dice)
      : m_generator(std::move(engine))
      , m_timer(std::move(timer))
      , m_dice(std::move(dice))
   {}

private:
   void Start(std::unique_ptr<ui::IDisplay> display) override
   {
      if (m_display)
         return;
      m_display = std::move(display);
      fsm::Context::SwitchToState<fsm::StateNegotiating>(CreateContext());
   }
   void OnLineReceived(std::string line) override
   {
      Log::Debug(TAG, "<<<<< [{}]", line);
      if (m_outcome) {
         Log::Warning(TAG, "Session is over, line ignored");
         return;
      }
      m_reader.SubmitLine(std::move(line));
      if (m_state)
         m_state->RethrowExceptions();
   }
   void OnInputClosed() override
   {
      Log::Info(TAG, "Input closed");
      if (m_outcome || !m_display)
         return;
      fsm::Context ctx = CreateContext();
      ctx.display.Show("Goodbye!");
      fsm::Context::Finish(ctx, core::Aborted{});
   }
   const std::optional<core::Outcome> & GetOutcome() const override { return m_outcome; }

   fsm::Context CreateContext()
   {
      return fsm::Context{m_generator.get(),
                          &m_dice,
                          m_timer.get(),
                          &m_reader,
                          core::DisplayAdapter(*m_display),
                          &m_outcome,
                          &m_state};
   }

   std::unique_ptr<dice::IEngine> m_generator;
   std::unique_ptr<core::Timer> m_timer;
   const dice::DiceSet m_dice;
   std::unique_ptr<ui::IDisplay> m_display;
   core::LineReader m_reader;
   std::optional<core::Outcome> m_outcome;
   std::unique_ptr<fsm::StateBase> m_state;
};

} // namespace

namespace core {

std::unique_ptr<IController> CreateController(std::unique_ptr<dice::IEngine> engine,
                                              std::unique_ptr<core::Timer> timer,
                                              dice::DiceSet dice)
{
   return std::make_unique<Controller>(std::move(engine), std::move(timer), std::move(dice));
}

} // namespace core
