#include "procsup/process_launcher.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

#include "procsup/internal/backend.hpp"
#include "procsup/internal/line_reader.hpp"
#include "procsup/internal/log.hpp"
#include "procsup/internal/lowering.hpp"
#include "procsup/pipe.hpp"
#include "procsup/recent_output.hpp"

namespace procsup {

struct ProcessLauncher::Impl {
  Impl(std::string name_in, std::vector<std::string> command)
      : name(std::move(name_in)), output_log(internal::logger()) {
    inputs.command = std::move(command);
  }

  std::string name;
  internal::LaunchInputs inputs;
  LauncherEvents* events = nullptr;
  std::shared_ptr<spdlog::logger> output_log;
  std::chrono::milliseconds kill_grace{kDefaultKillGrace};
  RecentOutputBuffer recent;

  mutable std::mutex mutex;
  std::condition_variable exit_cv;
  bool started = false;
  bool exited = false;
  std::optional<ExitStatus> status;
  internal::Backend* backend = nullptr;
  internal::Spawned spawned;

  std::thread notifier;
  std::thread reader;
  std::atomic<bool> cancel_reader{false};
  std::mutex reader_mutex;
  std::condition_variable reader_cv;
  bool reader_done = false;

  void on_line(internal::OutputStream stream, std::string line) {
    std::shared_ptr<spdlog::logger> log;
    {
      std::lock_guard<std::mutex> lock(mutex);
      log = output_log;
    }
    if (log) {
      if (stream == internal::OutputStream::err) {
        log->warn("{}", line);
      } else {
        log->info("{}", line);
      }
    }
    recent.append(std::move(line));
  }

  void run_reader(PipeReader out, PipeReader err) {
    auto sink = [this](internal::OutputStream stream, std::string line) {
      on_line(stream, std::move(line));
    };
    auto result = internal::read_lines(&out, &err, sink, cancel_reader);
    if (!result) {
      internal::logger()->warn("{}: reading output failed: {} ({})", name,
                               result.error().context, result.error().code.message());
    }
    {
      std::lock_guard<std::mutex> lock(reader_mutex);
      reader_done = true;
    }
    reader_cv.notify_all();
  }

  void run_notifier(LauncherEvents* target) {
    if (target != nullptr) {
      try {
        target->on_process_started();
      } catch (const std::exception& ex) {
        internal::logger()->error("{}: start notification failed: {}", name, ex.what());
      }
    }

    auto waited = backend->wait(spawned);
    ExitStatus exit_status = ExitStatus::exited(-1);
    if (waited) {
      exit_status = *waited;
    } else {
      internal::logger()->error("{}: wait failed: {} ({})", name, waited.error().context,
                                waited.error().code.message());
    }
    {
      std::lock_guard<std::mutex> lock(mutex);
      exited = true;
      status = exit_status;
    }
    exit_cv.notify_all();
    internal::logger()->info("{}: process {} exited with code {}", name, spawned.pid,
                             exit_status.raw_code());

    // Exit is reported as soon as it is known; final output is marked separately.
    if (target != nullptr) {
      try {
        target->on_process_exited(exit_status.raw_code(), exit_status.sign_corrected_code());
      } catch (const std::exception& ex) {
        internal::logger()->error("{}: exit notification failed: {}", name, ex.what());
      }
    }

    {
      std::unique_lock<std::mutex> lock(reader_mutex);
      if (!reader_cv.wait_for(lock, kFinalOutputGrace, [this] { return reader_done; })) {
        // A descendant still holds the pipes open.
        internal::logger()->debug("{}: output still open after exit, abandoning it", name);
        cancel_reader.store(true);
      }
    }
    recent.mark_final();
  }
};

ProcessLauncher::ProcessLauncher(std::string name, std::vector<std::string> command)
    : impl_(std::make_shared<Impl>(std::move(name), std::move(command))) {}

ProcessLauncher::~ProcessLauncher() {
  stop();
  impl_->cancel_reader.store(true);
  for (std::thread* thread : {&impl_->reader, &impl_->notifier}) {
    if (!thread->joinable()) {
      continue;
    }
    if (thread->get_id() == std::this_thread::get_id()) {
      thread->detach();
    } else {
      thread->join();
    }
  }
}

void ProcessLauncher::set_events(LauncherEvents* events) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->events = events;
}

void ProcessLauncher::put_env(const Environment& env) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  for (const auto& [key, value] : env) {
    impl_->inputs.env_overrides.insert_or_assign(key, value);
  }
}

void ProcessLauncher::set_output_log(std::shared_ptr<spdlog::logger> log) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->output_log = std::move(log);
}

void ProcessLauncher::set_recent_line_limit(std::size_t limit) {
  impl_->recent.set_line_limit(limit);
}

void ProcessLauncher::set_working_dir(std::filesystem::path dir) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->inputs.cwd = std::move(dir);
}

void ProcessLauncher::set_kill_grace(std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->kill_grace = grace;
}

Result<void> ProcessLauncher::start() {
  auto& impl = *impl_;
  std::lock_guard<std::mutex> lock(impl.mutex);
  if (impl.started) {
    return Error{.code = make_error_code(errc::invalid_state),
                 .context = impl.name + ": already started"};
  }

  auto spec = internal::lower_launch(impl.inputs);
  if (!spec) {
    return spec.error();
  }
  auto& backend = internal::default_backend();
  auto spawned = backend.spawn(*spec);
  if (!spawned) {
    internal::logger()->error("{}: failed to launch {}: {} ({})", impl.name,
                              impl.inputs.command.front(), spawned.error().context,
                              spawned.error().code.message());
    return spawned.error();
  }

  impl.started = true;
  impl.backend = &backend;
  impl.spawned = *spawned;
  internal::logger()->info("{}: launched {} (pid={})", impl.name, impl.inputs.command.front(),
                           impl.spawned.pid);

  PipeReader out(impl.spawned.stdout_fd.value_or(-1));
  PipeReader err(impl.spawned.stderr_fd.value_or(-1));
  impl.reader = std::thread(
      [state = &impl, out = std::move(out), err = std::move(err)]() mutable {
        state->run_reader(std::move(out), std::move(err));
      });
  // The notifier keeps the state alive if the launcher is destroyed from its callback.
  impl.notifier = std::thread([state = impl_, target = impl.events] {
    state->run_notifier(target);
  });
  return {};
}

void ProcessLauncher::stop() {
  auto& impl = *impl_;
  std::unique_lock<std::mutex> lock(impl.mutex);
  if (!impl.started || impl.exited) {
    return;
  }
  internal::logger()->info("{}: stopping process {}", impl.name, impl.spawned.pid);
  auto terminated = impl.backend->terminate(impl.spawned);
  if (!terminated) {
    internal::logger()->warn("{}: SIGTERM failed: {}", impl.name,
                             terminated.error().code.message());
  }
  if (impl.exit_cv.wait_for(lock, impl.kill_grace, [&impl] { return impl.exited; })) {
    return;
  }
  internal::logger()->warn("{}: process {} ignored SIGTERM, killing", impl.name,
                           impl.spawned.pid);
  auto killed = impl.backend->kill(impl.spawned);
  if (!killed) {
    internal::logger()->warn("{}: SIGKILL failed: {}", impl.name, killed.error().code.message());
  }
}

bool ProcessLauncher::is_running() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->started && !impl_->exited;
}

int ProcessLauncher::pid() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->started ? impl_->spawned.pid : -1;
}

std::optional<ExitStatus> ProcessLauncher::exit_status() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->status;
}

std::optional<int> ProcessLauncher::exit_code() const {
  auto status = exit_status();
  if (!status) {
    return std::nullopt;
  }
  return status->raw_code();
}

std::optional<int> ProcessLauncher::exit_code_sign_corrected() const {
  auto status = exit_status();
  if (!status) {
    return std::nullopt;
  }
  return status->sign_corrected_code();
}

std::vector<std::string> ProcessLauncher::recent_output() const {
  return impl_->recent.snapshot();
}

std::vector<std::string> ProcessLauncher::recent_output(bool want_final,
                                                        std::chrono::milliseconds wait) const {
  return impl_->recent.wait_for(want_final, wait);
}

}  // namespace procsup
