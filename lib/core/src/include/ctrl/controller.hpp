#ifndef CORE_CONTROLLER_HPP
#define CORE_CONTROLLER_HPP

#include "ctrl/outcome.hpp"
#include "dice/die.hpp"

#include <memory>
#include <optional>
#include <string>

namespace dice {
class IEngine;
}

namespace ui {
class IDisplay;
}

namespace core {
class Timer;

class IController
{
public:
   virtual ~IController() = default;
   virtual void Start(std::unique_ptr<ui::IDisplay> display) = 0;
   virtual void OnLineReceived(std::string line) = 0;
   virtual void OnInputClosed() = 0;
   // Set once the session reached a terminal state
   virtual const std::optional<Outcome> & GetOutcome() const = 0;
};

std::unique_ptr<IController> CreateController(std::unique_ptr<dice::IEngine> engine,
                                              std::unique_ptr<core::Timer> timer,
                                              dice::DiceSet dice);

} // namespace core

#endif // CORE_CONTROLLER_HPP
