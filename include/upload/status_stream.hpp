#ifndef ARLOADER_STATUS_STREAM_HPP
#define ARLOADER_STATUS_STREAM_HPP

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace arloader {

/**
 * @brief Either a value or the exception a background task ended with.
 */
template <typename T> class Outcome {
public:
  Outcome(T value) : state_(std::move(value)) {}
  Outcome(std::exception_ptr error) : state_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(state_); }

  /// The value, or rethrows the stored exception.
  T &get() {
    if (!ok())
      std::rethrow_exception(std::get<std::exception_ptr>(state_));
    return std::get<T>(state_);
  }

  std::exception_ptr error() const {
    return ok() ? nullptr : std::get<std::exception_ptr>(state_);
  }

  std::string errorMessage() const {
    if (ok())
      return "";
    try {
      std::rethrow_exception(std::get<std::exception_ptr>(state_));
    } catch (const std::exception &e) {
      return e.what();
    } catch (...) {
      return "unknown error";
    }
  }

private:
  std::variant<T, std::exception_ptr> state_;
};

/**
 * @brief Lazy, bounded, unordered map of @c task over @c inputs.
 *
 * Workers start on the first call to next(). At most @c buffer results are
 * in flight or waiting to be consumed. Results arrive in completion order.
 * Destroying the stream stops workers from picking new inputs; tasks
 * already running finish first.
 */
template <typename In, typename Out> class ResultStream {
public:
  using Task = std::function<Out(const In &)>;

  ResultStream(std::vector<In> inputs, Task task, size_t buffer)
      : inputs_(std::move(inputs)), task_(std::move(task)),
        buffer_(std::max<size_t>(buffer, 1)) {}

  ~ResultStream() { stop(); }

  ResultStream(const ResultStream &) = delete;
  ResultStream &operator=(const ResultStream &) = delete;

  size_t size() const { return inputs_.size(); }

  /**
   * @brief Blocks for the next finished item.
   *
   * Returns nullopt once all are delivered, or after stop() once the items
   * already finished have been handed out.
   */
  std::optional<Outcome<Out>> next() {
    start();
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] {
      return !ready_.empty() || delivered_ == inputs_.size() ||
             (cancelled_ && running_ == 0);
    });
    if (ready_.empty())
      return std::nullopt;
    Outcome<Out> item = std::move(ready_.front());
    ready_.pop_front();
    --outstanding_;
    ++delivered_;
    cv_.notify_all();
    return item;
  }

  /// Drains the stream.
  std::vector<Outcome<Out>> collect() {
    std::vector<Outcome<Out>> all;
    while (auto item = next())
      all.push_back(std::move(*item));
    return all;
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
    for (auto &w : workers_) {
      if (w.joinable())
        w.join();
    }
    workers_.clear();
  }

private:
  void start() {
    if (started_)
      return;
    started_ = true;
    size_t count = std::min(buffer_, inputs_.size());
    for (size_t i = 0; i < count; ++i)
      workers_.emplace_back(&ResultStream::threadFunc, this);
  }

  void threadFunc() {
    while (true) {
      size_t index;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return cancelled_ || outstanding_ < buffer_; });
        if (cancelled_ || next_ >= inputs_.size())
          return;
        index = next_++;
        ++outstanding_;
        ++running_;
      }

      std::optional<Outcome<Out>> result;
      try {
        result.emplace(task_(inputs_[index]));
      } catch (...) {
        result.emplace(std::current_exception());
      }

      {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(*result));
        --running_;
      }
      cv_.notify_all();
    }
  }

  std::vector<In> inputs_;
  Task task_;
  size_t buffer_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Outcome<Out>> ready_;
  size_t next_{0};
  size_t outstanding_{0};
  size_t running_{0};
  size_t delivered_{0};
  bool cancelled_{false};
  bool started_{false};
  std::vector<std::thread> workers_;
};

} // namespace arloader

#endif // ARLOADER_STATUS_STREAM_HPP
