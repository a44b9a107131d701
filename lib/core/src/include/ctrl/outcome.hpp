#ifndef CORE_OUTCOME_HPP
#define CORE_OUTCOME_HPP

#include "dice/round.hpp"

#include <variant>

namespace core {

// The player left on purpose. Not an error.
struct Aborted
{};

using Outcome = std::variant<Aborted, dice::RoundResult>;

} // namespace core

#endif // CORE_OUTCOME_HPP
