#pragma once

#include "gradepace/batch/batch_types.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace gradepace::batch {

// Single-producer / single-consumer queue of batch events for one subscribed job.
//
// The producer calls Push and finally Finish. The consumer calls Next until it
// returns nullopt with Drained() == true, or calls Close to cancel the job.
class EventStream {
public:
  void Push(BatchEvent ev);

  // Producer side: no more events will follow.
  void Finish();

  // Consumer side: stop listening. Pending events are dropped and the producer
  // stops before its next file.
  void Close();

  // Waits up to `timeout`. nullopt on timeout, on Close, or when finished and empty.
  std::optional<BatchEvent> Next(std::chrono::milliseconds timeout);

  bool IsClosed() const;
  bool Drained() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<BatchEvent> queue_;
  bool finished_ = false;
  bool closed_ = false;
};

} // namespace gradepace::batch
