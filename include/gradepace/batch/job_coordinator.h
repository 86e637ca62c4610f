#pragma once
/**
 * @file job_coordinator.h
 * @brief Asynchronous batch jobs: submit -> subscribe -> streamed events.
 *
 * Lifecycle: Submit registers a Created job. Subscribe starts one worker thread for it
 * (Processing) and returns the event stream. The job leaves the registry when it
 * reaches a terminal event or is cancelled. Jobs nobody subscribes to are evicted by
 * the sweeper thread after the TTL.
 */

#include "gradepace/batch/batch_processor.h"
#include "gradepace/batch/batch_types.h"
#include "gradepace/batch/event_stream.h"
#include "gradepace/config/config_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace gradepace::batch {

struct CoordinatorConfig {
  std::chrono::milliseconds job_ttl{600000};
  std::chrono::milliseconds sweep_interval{30000};
  std::chrono::milliseconds progress_pacing{0};
  bool verbose = false;
};

CoordinatorConfig MakeCoordinatorConfig(const cfg::BatchRuntimeCfg& rt, bool verbose);

class JobCoordinator {
public:
  explicit JobCoordinator(const CoordinatorConfig& cfg = CoordinatorConfig(),
                          BatchProcessor processor = BatchProcessor());
  ~JobCoordinator();

  JobCoordinator(const JobCoordinator&) = delete;
  JobCoordinator& operator=(const JobCoordinator&) = delete;

  // Returns a 128-bit random hex id. Request validation happens when the job runs,
  // so a bad request surfaces as a single error event.
  // @throws std::runtime_error after Shutdown.
  std::string Submit(std::vector<ActivityFile> files, const BatchOptions& opts);

  // Starts processing. The worker only keeps a weak reference to the stream:
  // dropping or closing it cancels the job before its next file.
  // @throws std::invalid_argument for unknown (or already subscribed) ids.
  std::shared_ptr<EventStream> Subscribe(const std::string& job_id);

  std::optional<JobState> State(const std::string& job_id) const;
  std::size_t JobCount() const;

  // Evicts Created jobs older than the TTL; returns the number evicted.
  std::size_t SweepExpired();

  // Stops the sweeper, cancels running jobs and joins every thread. Idempotent.
  void Shutdown();

private:
  using Clock = std::chrono::steady_clock;

  struct Job {
    std::string id;
    std::vector<ActivityFile> files;
    BatchOptions opts;
    Clock::time_point created;
    Clock::time_point updated;
    JobState state = JobState::Created;
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::string NewJobId();
  void WorkerMain(std::shared_ptr<Job> job, std::weak_ptr<EventStream> stream);
  void SweeperLoop();
  void ReapFinishedWorkers();
  void SetState(const std::string& job_id, JobState s);

  CoordinatorConfig cfg_;
  BatchProcessor processor_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
  std::atomic<bool> cancel_all_{false};
  std::map<std::string, std::shared_ptr<Job>> jobs_;

  std::mutex workers_mu_;
  std::vector<Worker> workers_;
  std::thread sweeper_;

  std::mutex rng_mu_;
  std::mt19937_64 rng_;
};

} // namespace gradepace::batch
