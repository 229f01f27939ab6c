#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/scheduler/scheduler_service.hpp"

namespace flowsched::scheduler {

/*
  Background worker that sweeps all deployments.

  Executes:
      ScheduleAllDeployments, then sleeps loop_interval, until Stop()
*/
class ScheduleWorker {
 public:
  static constexpr std::chrono::milliseconds kDefaultLoopInterval{60000};

  ScheduleWorker(std::shared_ptr<SchedulerService> service, std::chrono::milliseconds loop_interval = kDefaultLoopInterval,
                 SweepOptions options = {});
  ~ScheduleWorker();

  void Start();
  // Wakes a sleeping worker and joins it.
  void Stop();

  std::size_t CompletedSweeps() const {
    return sweeps_.load();
  }

 private:
  void Run();

  std::shared_ptr<SchedulerService> service_;
  std::chrono::milliseconds         loop_interval_;
  SweepOptions                      options_;

  std::thread              thread_;
  std::mutex               mutex_;
  std::condition_variable  cv_;
  bool                     running_ = false;
  std::atomic<std::size_t> sweeps_{0};
};

} // namespace flowsched::scheduler
