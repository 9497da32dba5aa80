#include "procsup/service.hpp"

#include <exception>

#include "procsup/internal/log.hpp"

namespace procsup {

const char* to_string(ServiceState state) noexcept {
  switch (state) {
    case ServiceState::not_inited:
      return "not_inited";
    case ServiceState::inited:
      return "inited";
    case ServiceState::started:
      return "started";
    case ServiceState::stopped:
      return "stopped";
  }
  return "unknown";
}

Result<void> Service::init() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.load() == ServiceState::not_inited) {
    state_.store(ServiceState::inited);
  }
  return {};
}

Result<void> Service::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ServiceState current = state_.load();
    if (current == ServiceState::stopped) {
      return Error{.code = make_error_code(errc::invalid_state),
                   .context = name_ + ": cannot start a stopped service"};
    }
    if (current == ServiceState::started) {
      return {};
    }
    state_.store(ServiceState::started);
  }
  internal::logger()->debug("{}: starting", name_);
  auto started = on_service_start();
  if (!started) {
    internal::logger()->error("{}: start failed: {}", name_, started.error().context);
    stop();
    return started.error();
  }
  return {};
}

void Service::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() == ServiceState::stopped) {
      return;
    }
    state_.store(ServiceState::stopped);
  }
  internal::logger()->debug("{}: stopping", name_);
  try {
    on_service_stop();
  } catch (const std::exception& ex) {
    internal::logger()->error("{}: stop hook failed: {}", name_, ex.what());
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    terminated_ = true;
  }
  terminated_cv_.notify_all();
}

bool Service::wait_for_service_to_stop(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return terminated_cv_.wait_for(lock, timeout, [this] { return terminated_; });
}

std::optional<FailureRecord> Service::failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_;
}

void Service::add_fault_handler(FaultHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  fault_handlers_.push_back(std::move(handler));
}

void Service::note_failure(const FailureRecord& record) {
  std::vector<FaultHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure_) {
      return;
    }
    failure_ = record;
    handlers = fault_handlers_;
  }
  internal::logger()->warn("{}: failed: {}", name_, record.message);
  for (const auto& handler : handlers) {
    try {
      handler(record);
    } catch (const std::exception& ex) {
      internal::logger()->error("{}: fault handler failed: {}", name_, ex.what());
    }
  }
}

}  // namespace procsup
