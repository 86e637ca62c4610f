#include "gradepace/batch/job_coordinator.h"

#include <cmath>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace gradepace::batch {

namespace {

std::chrono::milliseconds seconds_to_ms(double s) {
  return std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
}

} // namespace

CoordinatorConfig MakeCoordinatorConfig(const cfg::BatchRuntimeCfg& rt, bool verbose) {
  CoordinatorConfig c;
  c.job_ttl = seconds_to_ms(rt.job_ttl_s);
  c.sweep_interval = seconds_to_ms(rt.sweep_interval_s);
  c.progress_pacing = std::chrono::milliseconds(rt.progress_pacing_ms);
  c.verbose = verbose;
  return c;
}

JobCoordinator::JobCoordinator(const CoordinatorConfig& cfg, BatchProcessor processor)
    : cfg_(cfg),
      processor_(std::move(processor)) {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  rng_.seed(seq);

  if (cfg_.sweep_interval.count() <= 0) {
    throw std::invalid_argument("JobCoordinator sweep interval must be positive");
  }
  sweeper_ = std::thread(&JobCoordinator::SweeperLoop, this);
}

JobCoordinator::~JobCoordinator() {
  Shutdown();
}

std::string JobCoordinator::NewJobId() {
  std::uint64_t hi = 0, lo = 0;
  {
    std::lock_guard<std::mutex> lock(rng_mu_);
    hi = rng_();
    lo = rng_();
  }
  char buf[33];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                static_cast<unsigned long long>(hi), static_cast<unsigned long long>(lo));
  return buf;
}

std::string JobCoordinator::Submit(std::vector<ActivityFile> files, const BatchOptions& opts) {
  auto job = std::make_shared<Job>();
  job->files = std::move(files);
  job->opts = opts;
  job->created = job->updated = Clock::now();

  std::lock_guard<std::mutex> lock(mu_);
  if (stop_) {
    throw std::runtime_error("JobCoordinator is shut down");
  }
  do {
    job->id = NewJobId();
  } while (jobs_.count(job->id) != 0);
  jobs_[job->id] = job;

  if (cfg_.verbose) {
    std::cout << "[jobs] submitted " << job->id << " (" << job->files.size() << " files)\n";
  }
  return job->id;
}

std::shared_ptr<EventStream> JobCoordinator::Subscribe(const std::string& job_id) {
  ReapFinishedWorkers();

  auto stream = std::make_shared<EventStream>();

  // The worker is registered under mu_ so Shutdown never misses it.
  std::lock_guard<std::mutex> lock(mu_);
  if (stop_) {
    throw std::runtime_error("JobCoordinator is shut down");
  }
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw std::invalid_argument("Job not found: " + job_id);
  }
  if (it->second->state != JobState::Created) {
    throw std::invalid_argument("Job already subscribed: " + job_id);
  }
  std::shared_ptr<Job> job = it->second;
  job->state = JobState::Processing;
  job->updated = Clock::now();

  Worker w;
  w.done = std::make_shared<std::atomic<bool>>(false);
  std::weak_ptr<EventStream> weak = stream;
  auto done = w.done;
  w.thread = std::thread([this, job, weak, done]() {
    WorkerMain(job, weak);
    done->store(true);
  });

  std::lock_guard<std::mutex> wlock(workers_mu_);
  workers_.push_back(std::move(w));
  return stream;
}

void JobCoordinator::SetState(const std::string& job_id, JobState s) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return;
  it->second->state = s;
  it->second->updated = Clock::now();
}

void JobCoordinator::WorkerMain(std::shared_ptr<Job> job, std::weak_ptr<EventStream> stream) {
  auto cancelled = [&]() {
    if (cancel_all_.load()) return true;
    auto s = stream.lock();
    return !s || s->IsClosed();
  };
  auto sink = [&](const BatchEvent& ev) {
    if (auto s = stream.lock()) s->Push(ev);
  };

  JobState final_state = JobState::Failed;
  try {
    if (processor_.Run(job->id, job->files, job->opts, sink, cancelled, cfg_.progress_pacing)) {
      final_state = JobState::Completed;
    }
  } catch (const std::exception& e) {
    BatchEvent err;
    err.kind = EventKind::Error;
    err.job_id = job->id;
    err.message = e.what();
    sink(err);
    if (cfg_.verbose) {
      std::cerr << "ERROR: job " << job->id << ": " << e.what() << "\n";
    }
  }
  SetState(job->id, final_state);

  // Terminal (or cancelled): drop job state and its buffers.
  {
    std::lock_guard<std::mutex> lock(mu_);
    jobs_.erase(job->id);
  }
  job->files.clear();
  job->files.shrink_to_fit();

  if (auto s = stream.lock()) s->Finish();

  if (cfg_.verbose) {
    std::cout << "[jobs] " << job->id << " finished: " << JobStateText(final_state) << "\n";
  }
}

std::optional<JobState> JobCoordinator::State(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second->state;
}

std::size_t JobCoordinator::JobCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return jobs_.size();
}

std::size_t JobCoordinator::SweepExpired() {
  const auto now = Clock::now();
  std::size_t evicted = 0;
  std::lock_guard<std::mutex> lock(mu_);
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    const Job& j = *it->second;
    if (j.state == JobState::Created && now - j.created > cfg_.job_ttl) {
      if (cfg_.verbose) {
        std::cout << "[jobs] evicted stale job " << j.id << "\n";
      }
      it = jobs_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

void JobCoordinator::ReapFinishedWorkers() {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->done->load()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& w : finished) {
    if (w.thread.joinable()) w.thread.join();
  }
}

void JobCoordinator::SweeperLoop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, cfg_.sweep_interval, [&]() { return stop_; });
      if (stop_) break;
    }
    SweepExpired();
    ReapFinishedWorkers();
  }
}

void JobCoordinator::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_ && !sweeper_.joinable()) return;
    stop_ = true;
  }
  cancel_all_.store(true);
  cv_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }

  std::vector<Worker> all;
  {
    std::lock_guard<std::mutex> lock(workers_mu_);
    all.swap(workers_);
  }
  for (auto& w : all) {
    if (w.thread.joinable()) w.thread.join();
  }

  std::lock_guard<std::mutex> lock(mu_);
  jobs_.clear();
}

} // namespace gradepace::batch
