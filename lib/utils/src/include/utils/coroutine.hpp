#ifndef COROUTINE_HPP
#define COROUTINE_HPP

#include <coroutine>

namespace stdcr {
using std::coroutine_handle;
using std::noop_coroutine;
using std::suspend_always;
using std::suspend_never;
} // namespace stdcr

#endif
