#include "internal/scheduler/schedule_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace flowsched::scheduler {

ScheduleWorker::ScheduleWorker(std::shared_ptr<SchedulerService> service, std::chrono::milliseconds loop_interval,
                               SweepOptions options)
    : service_(std::move(service)),
      loop_interval_(loop_interval.count() > 0 ? loop_interval : kDefaultLoopInterval),
      options_(options) {
}

ScheduleWorker::~ScheduleWorker() {
  Stop();
}

void ScheduleWorker::Start() {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_  = std::thread(&ScheduleWorker::Run, this);
}

void ScheduleWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void ScheduleWorker::Run() {
  FLOWSCHED_LOG_INFO("schedule worker started", {observability::IntField("loop_interval_ms", loop_interval_.count())});

  for (;;) {
    try {
      service_->ScheduleAllDeployments(options_);
    } catch (const std::exception& e) {
      FLOWSCHED_LOG_ERROR("schedule sweep failed", {observability::StringField("error", e.what())});
    }
    ++sweeps_;

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, loop_interval_, [this] { return !running_; })) {
      break;
    }
  }

  FLOWSCHED_LOG_INFO("schedule worker stopped");
}

} // namespace flowsched::scheduler
