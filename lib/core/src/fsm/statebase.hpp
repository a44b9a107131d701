#ifndef FSM_STATEBASE_HPP
#define FSM_STATEBASE_HPP

#include "utils/taskowner.hpp"

namespace fsm {

class StateBase : protected cr::TaskOwner
{
protected:
   StateBase() = default;

public:
   virtual ~StateBase() = default;
   using cr::TaskOwner::RethrowExceptions;
};

} // namespace fsm

#endif // FSM_STATEBASE_HPP
