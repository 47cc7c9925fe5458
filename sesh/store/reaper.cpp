#include "sesh/store/reaper.hpp"

namespace sesh::store {

reaper_c::reaper_c(std::shared_ptr<spdlog::logger> logger,
                   std::chrono::seconds interval, sweepable_if &target)
    : logger_(std::move(logger)), interval_(interval), target_(target),
      running_(false), total_reclaimed_(0) {}

reaper_c::~reaper_c() { stop(); }

void reaper_c::start() {
  if (running_.load()) {
    return;
  }

  running_.store(true);
  worker_ = std::thread([this] { run(); });
  logger_->info("reaper: started, sweeping every {}s", interval_.count());
}

void reaper_c::stop() {
  if (!running_.load()) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    running_.store(false);
  }
  wake_cv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
  logger_->info("reaper: stopped");
}

bool reaper_c::is_running() const { return running_.load(); }

std::size_t reaper_c::total_reclaimed() const {
  return total_reclaimed_.load();
}

result_c<std::size_t> reaper_c::sweep_now() {
  auto result = target_.sweep_expired();
  if (result.is_error()) {
    logger_->error("reaper: sweep failed: {}", result.error().message);
    return result;
  }

  total_reclaimed_ += result.value();
  if (result.value() > 0) {
    logger_->info("reaper: reclaimed {} expired sessions", result.value());
  }
  return result;
}

void reaper_c::run() {
  while (running_.load()) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      wake_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }

    if (!running_.load()) {
      break;
    }

    // Failures are logged and retried on the next tick
    sweep_now();
  }
}

} // namespace sesh::store
