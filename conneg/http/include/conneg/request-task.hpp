#pragma once

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>

namespace conneg {

namespace detail {

// Common part of all RequestTask promises, linking a chain of coroutines awaiting each other.
struct RequestTaskPromiseBase {
  struct FinalAwaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    // Symmetric transfer to the awaiting coroutine, if any.
    template <class Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) const noexcept {
      auto continuation = handle.promise()._continuation;
      return continuation ? continuation : std::noop_coroutine();
    }

    void await_resume() const noexcept {}
  };

  std::suspend_always initial_suspend() noexcept { return {}; }
  FinalAwaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { _exception = std::current_exception(); }

  std::coroutine_handle<> _self;
  // Coroutine suspended in a co_await on this one.
  std::coroutine_handle<> _continuation;
  // Task this coroutine is currently suspended on, if any.
  RequestTaskPromiseBase* _awaitedChild{nullptr};
  std::exception_ptr _exception;
};

// Resumes the innermost suspended coroutine of the chain starting at 'root'.
inline void ResumeInnermost(RequestTaskPromiseBase& root) {
  RequestTaskPromiseBase* promise = &root;
  while (promise->_awaitedChild != nullptr) {
    promise = promise->_awaitedChild;
  }
  promise->_self.resume();
}

}  // namespace detail

// Lazily started coroutine task producing a T.
// A RequestTask can be awaited from another RequestTask coroutine: the awaiting coroutine suspends until the awaited
// one completes, then resumes on the same continuation. Whoever drives the outermost task (an event loop, or
// runSynchronously()) only deals with that task: resume() always resumes the innermost suspended coroutine.
template <class T>
class RequestTask {
 public:
  struct promise_type : detail::RequestTaskPromiseBase {
    RequestTask get_return_object() noexcept {
      auto handle = std::coroutine_handle<promise_type>::from_promise(*this);
      _self = handle;
      return RequestTask{handle};
    }

    void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value = std::move(value); }

    T&& consume_result() {
      if (_exception) {
        std::rethrow_exception(_exception);
      }
      return std::move(_value);
    }

    T _value{};
  };

  class Awaiter {
   public:
    explicit Awaiter(std::coroutine_handle<promise_type> coro) noexcept : _coro(coro) {}

    [[nodiscard]] bool await_ready() const noexcept { return _coro.done(); }

    template <class ParentPromise>
      requires std::is_base_of_v<detail::RequestTaskPromiseBase, ParentPromise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<ParentPromise> parent) noexcept {
      _parent = &parent.promise();
      _parent->_awaitedChild = &_coro.promise();
      _coro.promise()._continuation = parent;
      return _coro;
    }

    T await_resume() {
      if (_parent != nullptr) {
        _parent->_awaitedChild = nullptr;
      }
      return std::move(_coro.promise().consume_result());
    }

   private:
    std::coroutine_handle<promise_type> _coro;
    detail::RequestTaskPromiseBase* _parent{nullptr};
  };

  RequestTask() noexcept = default;
  explicit RequestTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  RequestTask(RequestTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  RequestTask& operator=(RequestTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  RequestTask(const RequestTask&) = delete;
  RequestTask& operator=(const RequestTask&) = delete;

  ~RequestTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  // Resumes the innermost suspended coroutine of this task. No-op if the task is done.
  void resume() {
    if (!done()) {
      detail::ResumeInnermost(_coro.promise());
    }
  }

  // Drives the task to completion on the calling thread and returns its result.
  // Rethrows the exception that escaped the coroutine, if any.
  T runSynchronously() {
    while (!done()) {
      resume();
    }
    return std::move(_coro.promise().consume_result());
  }

  // Awaiting an invalid (default constructed or moved-from) task is undefined behavior.
  Awaiter operator co_await() noexcept { return Awaiter{_coro}; }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace conneg
