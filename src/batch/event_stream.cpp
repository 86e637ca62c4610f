#include "gradepace/batch/event_stream.h"

#include <utility>

namespace gradepace::batch {

void EventStream::Push(BatchEvent ev) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_ || finished_) return;
    queue_.push_back(std::move(ev));
  }
  cv_.notify_all();
}

void EventStream::Finish() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    finished_ = true;
  }
  cv_.notify_all();
}

void EventStream::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    queue_.clear();
  }
  cv_.notify_all();
}

std::optional<BatchEvent> EventStream::Next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, timeout, [&]() { return closed_ || finished_ || !queue_.empty(); });
  if (closed_ || queue_.empty()) return std::nullopt;

  BatchEvent ev = std::move(queue_.front());
  queue_.pop_front();
  return ev;
}

bool EventStream::IsClosed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

bool EventStream::Drained() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_ || (finished_ && queue_.empty());
}

} // namespace gradepace::batch
