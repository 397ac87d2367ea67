#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace cmdgate {

class TimeoutError : public std::runtime_error {
public:
  explicit TimeoutError(std::chrono::milliseconds after)
      : std::runtime_error("Operation timed out after " +
                           std::to_string(after.count()) + "ms"),
        after_(after) {}

  std::chrono::milliseconds after() const { return after_; }

private:
  std::chrono::milliseconds after_;
};

// Runs `work` on a detached thread and waits at most `timeout` for it.
// On expiry throws TimeoutError; the work itself keeps running, so it must
// own (or share ownership of) everything it touches. Exceptions thrown by
// `work` propagate to the caller.
template <typename Fn>
auto run_with_timeout(Fn work, std::chrono::milliseconds timeout)
    -> std::invoke_result_t<Fn &> {
  using R = std::invoke_result_t<Fn &>;
  auto task = std::make_shared<std::packaged_task<R()>>(std::move(work));
  std::future<R> fut = task->get_future();
  std::thread([task] { (*task)(); }).detach();

  if (fut.wait_for(timeout) == std::future_status::timeout)
    throw TimeoutError(timeout);
  return fut.get();
}

} // namespace cmdgate
