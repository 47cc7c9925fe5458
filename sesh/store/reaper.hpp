#pragma once

#include "sesh/store/store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>

namespace sesh::store {

//! \brief Background thread that periodically reclaims expired sessions
//!        from a store that does not expire records on its own
class reaper_c {
public:
  reaper_c(const reaper_c &) = delete;
  reaper_c &operator=(const reaper_c &) = delete;

  reaper_c(std::shared_ptr<spdlog::logger> logger,
           std::chrono::seconds interval, sweepable_if &target);
  ~reaper_c();

  void start();
  void stop();
  bool is_running() const;

  //! \brief Run one sweep on the calling thread
  result_c<std::size_t> sweep_now();

  std::size_t total_reclaimed() const;

private:
  void run();

  std::shared_ptr<spdlog::logger> logger_;
  std::chrono::seconds interval_;
  sweepable_if &target_;

  std::atomic<bool> running_;
  std::atomic<std::size_t> total_reclaimed_;
  std::thread worker_;
  std::mutex wait_mutex_;
  std::condition_variable wake_cv_;
};

} // namespace sesh::store
