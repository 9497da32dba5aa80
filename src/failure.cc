#include "procsup/failure.hpp"

#include <exception>

#include "procsup/internal/log.hpp"

namespace procsup {

Error FailureRecord::to_error() const {
  auto value = kind == FailureKind::timeout ? errc::timeout : errc::process_exit_failure;
  return Error{.code = make_error_code(value), .context = message};
}

bool FailureReporter::report(FailureRecord record) {
  if (reported_.exchange(true)) {
    internal::logger()->debug("Failure already reported, dropping: {}", record.message);
    return false;
  }
  internal::logger()->debug("Noting failure: {}", record.message);
  if (!sink_) {
    return true;
  }
  try {
    sink_(record);
  } catch (const std::exception& ex) {
    internal::logger()->error("fault handler failed: {}", ex.what());
  }
  return true;
}

}  // namespace procsup
