#ifndef FSM_PROMPT_HPP
#define FSM_PROMPT_HPP

#include "fsm/context.hpp"

#include "utils/task.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace fsm {

// Usage text followed by the win probability table of the configured dice
void ShowHelp(Context & ctx);

// Shows the menu and reads lines until one names an option below optionCount.
// Help is answered in place, nullopt means the player asked to exit.
[[nodiscard]] cr::TaskHandle<std::optional<uint32_t>> AwaitChoice(Context ctx,
                                                                  uint32_t optionCount,
                                                                  std::function<void()> showMenu,
                                                                  std::string invalidNotice);

} // namespace fsm

#endif // FSM_PROMPT_HPP
