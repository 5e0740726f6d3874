#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

#include <boost/asio.hpp>

// Multi-producer, single-consumer queue. Producers post onto an ASIO
// io_context; the consumer drives the context while it waits, so pops
// see values in the order they were pushed.
template<typename T>
class DispatchQueue {
  std::mutex mtx; // Locks the queue
  std::queue<T> queue;
  bool closed = false;

  boost::asio::io_context ctx;

  // Keeps ctx.run_one() blocking while there is nothing posted yet.
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;

  // nullopt either when empty, or when closed and drained (see `finished`)
  std::optional<T> lock_and_pop_value(bool& finished) {
    std::lock_guard guard(mtx);
    if (queue.empty()) {
      finished = closed;
      return {};
    }
    auto t = std::move(queue.front());
    queue.pop();
    return t;
  }

public:
  DispatchQueue()
    : ctx()
    , work(boost::asio::make_work_guard(ctx)) {}

  void push(T t) {
    boost::asio::post(ctx, [this, t=std::move(t)]() mutable {
      std::lock_guard guard(mtx);
      if (!closed) {
        queue.push(std::move(t));
      }
    });
  }

  // Values pushed before close() are still handed out; later ones are dropped.
  void close() {
    boost::asio::post(ctx, [this]() {
      std::lock_guard guard(mtx);
      closed = true;
    });
  }

  // Block until a value is ready. nullopt once closed and drained.
  std::optional<T> pop() {
    bool finished = false;
    auto result = lock_and_pop_value(finished);
    while (!result && !finished) {
      ctx.run_one();
      result = lock_and_pop_value(finished);
    }
    return result;
  }

  // Like pop(), but gives up after `timeout`.
  template<typename Ref, typename Period>
  std::optional<T> pop_timeout(std::chrono::duration<Ref, Period> timeout) {
    bool finished = false;
    auto result = lock_and_pop_value(finished);
    auto end_time_point = std::chrono::steady_clock::now() + timeout;
    while (!result && !finished) {
      // zero means the deadline passed with nothing to run
      if (!ctx.run_one_until(end_time_point)) {
        break;
      }
      result = lock_and_pop_value(finished);
    }
    return result;
  }
};
