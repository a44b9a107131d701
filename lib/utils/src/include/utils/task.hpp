#ifndef TASK_HPP
#define TASK_HPP

#include "utils/coroutine.hpp"

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace cr {

// clang-format off

template <typename T>
concept TaskResult = std::is_move_constructible_v<T> || std::is_same_v<T, void>;


namespace internal {

template <typename T>
struct ValidAwaitSuspendReturnType : std::false_type
{};
template <>
struct ValidAwaitSuspendReturnType<bool> : std::true_type
{};
template <>
struct ValidAwaitSuspendReturnType<void> : std::true_type
{};
template <typename P>
struct ValidAwaitSuspendReturnType<stdcr::coroutine_handle<P>> : std::true_type
{};
template <typename T>
concept AwaitSuspendReturnType = ValidAwaitSuspendReturnType<T>::value;

} // namespace internal


template <typename T>
concept Awaiter = requires(T && awaiter, stdcr::coroutine_handle<void> h) {
   static_cast<bool>(awaiter.await_ready());
   awaiter.await_resume();
   requires internal::AwaitSuspendReturnType<decltype(awaiter.await_suspend(h))>;
};


namespace internal {

struct DetachedPromise;

template <TaskResult T>
struct Promise;

} // namespace internal

// clang-format on

// Fire-and-forget coroutine: starts eagerly, owns itself, rethrows whatever escapes it.
struct DetachedHandle
{
   using promise_type = internal::DetachedPromise;
};

struct CanceledException : std::exception
{
   const char * what() const noexcept override { return "Coroutine canceled"; }
};

// Lazily started coroutine. Destroying the handle of a suspended task cancels it: the task
// gets a CanceledException the next time it is resumed and then frees itself.
template <TaskResult T>
struct TaskHandle
{
   using promise_type = internal::Promise<T>;
   using handle_type = stdcr::coroutine_handle<promise_type>;

   TaskHandle() noexcept;
   TaskHandle(TaskHandle && other) noexcept;
   explicit TaskHandle(promise_type & promise);
   ~TaskHandle();
   TaskHandle & operator=(TaskHandle && other) noexcept;

   explicit operator bool() const noexcept;
   auto Run(const bool * parentCanceled = nullptr);
   void EnsureNoException();
   void Swap(TaskHandle & other) noexcept;

private:
   handle_type m_handle;
};


namespace internal {

struct DetachedPromise
{
   DetachedHandle get_return_object() const noexcept { return {}; }
   stdcr::suspend_never initial_suspend() const noexcept { return {}; }
   stdcr::suspend_never final_suspend() const noexcept { return {}; }
   void unhandled_exception() const { throw; }
   void return_void() noexcept {}
   template <Awaiter A>
   decltype(auto) await_transform(A && a)
   {
      return std::forward<A>(a);
   }
   template <TaskResult T>
   auto await_transform(TaskHandle<T> && handle)
   {
      return handle.Run();
   }
};

template <TaskResult T>
struct ValueHolder
{
   template <typename U>
   void return_value(U && val)
   {
      value.template emplace<T>(std::forward<U>(val));
   }
   T RetrieveValue() { return std::get<T>(std::move(value)); }

   std::variant<std::monostate, T, std::exception_ptr> value;
};

template <>
struct ValueHolder<void>
{
   void return_void() const noexcept {}
   void RetrieveValue() const noexcept {}

   std::variant<std::monostate, std::exception_ptr> value;
};

template <TaskResult T>
struct Promise : public ValueHolder<T>
{
   template <Awaiter A>
   struct CancelingAwaiter : A
   {
      const Promise & p;
      decltype(auto) await_resume()
      {
         if (p.IsCanceled())
            throw CanceledException{};
         return A::await_resume();
      }
   };

   bool canceled = false;
   const bool * parentCanceled = nullptr;
   stdcr::coroutine_handle<> parentHandle = nullptr;

   bool IsCanceled() const noexcept { return canceled || (parentCanceled && *parentCanceled); }

   TaskHandle<T> get_return_object() { return TaskHandle<T>{*this}; }

   void unhandled_exception() noexcept
   {
      this->value.template emplace<std::exception_ptr>(std::current_exception());
   }

   template <Awaiter A>
   auto await_transform(A && awaiter) const
   {
      return CancelingAwaiter<std::remove_reference_t<A>>{std::forward<A>(awaiter), *this};
   }

   template <TaskResult R>
   auto await_transform(TaskHandle<R> && innerTask) const
   {
      using InnerAwaiter = std::remove_reference_t<decltype(innerTask.Run())>;
      return CancelingAwaiter<InnerAwaiter>{innerTask.Run(parentCanceled ? parentCanceled
                                                                         : &canceled),
                                            *this};
   }

   auto initial_suspend() noexcept { return CancelingAwaiter<stdcr::suspend_always>{{}, *this}; }

   auto final_suspend() noexcept
   {
      struct ResumingAwaitable
      {
         Promise & p;

         bool await_ready() const noexcept { return p.canceled; }
         stdcr::coroutine_handle<> await_suspend(stdcr::coroutine_handle<>) noexcept
         {
            if (p.parentHandle)
               return p.parentHandle;
            return stdcr::noop_coroutine();
         }
         void await_resume() const noexcept {}
      };
      return ResumingAwaitable{*this};
   }
};

} // namespace internal

template <TaskResult T>
TaskHandle<T>::TaskHandle() noexcept
   : m_handle(nullptr)
{}

template <TaskResult T>
TaskHandle<T>::TaskHandle(TaskHandle && other) noexcept
   : TaskHandle()
{
   Swap(other);
}

template <TaskResult T>
TaskHandle<T>::TaskHandle(promise_type & promise)
   : m_handle(handle_type::from_promise(promise))
{}

template <TaskResult T>
TaskHandle<T>::~TaskHandle()
{
   if (!m_handle)
      return;

   if (m_handle.done()) {
      m_handle.destroy();
      return;
   }

   m_handle.promise().canceled = true;
}

template <TaskResult T>
TaskHandle<T> & TaskHandle<T>::operator=(TaskHandle && other) noexcept
{
   TaskHandle(std::move(other)).Swap(*this);
   return *this;
}

template <TaskResult T>
TaskHandle<T>::operator bool() const noexcept
{
   return m_handle && !m_handle.done();
}

template <TaskResult T>
auto TaskHandle<T>::Run(const bool * parentCanceled)
{
   handle_type handle = m_handle;
   handle.promise().parentCanceled = parentCanceled;
   handle.resume();

   struct Awaiter
   {
      handle_type handle;

      bool await_ready() const noexcept { return handle.done(); }
      void await_suspend(stdcr::coroutine_handle<> h) { handle.promise().parentHandle = h; }
      T await_resume()
      {
         if (std::holds_alternative<std::exception_ptr>(handle.promise().value))
            std::rethrow_exception(std::get<std::exception_ptr>(handle.promise().value));
         return handle.promise().RetrieveValue();
      }
   };
   return Awaiter{handle};
}

template <TaskResult T>
void TaskHandle<T>::EnsureNoException()
{
   if (!m_handle || !m_handle.done())
      return;

   if (const auto * exptr = std::get_if<std::exception_ptr>(&m_handle.promise().value)) {
      std::exception_ptr copy = *exptr;
      m_handle.promise().value.template emplace<std::monostate>();
      std::rethrow_exception(copy);
   }
}

template <TaskResult T>
void TaskHandle<T>::Swap(TaskHandle & other) noexcept
{
   std::swap(m_handle, other.m_handle);
}

} // namespace cr

#endif
