#include "procsup/supervisor.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "tests/helpers/fake_launcher.hpp"

namespace procsup {

namespace {

using std::chrono::milliseconds;
using testing::FakeProcess;

constexpr milliseconds kStopWait{5000};

struct Harness {
  std::shared_ptr<FakeProcess> process = std::make_shared<FakeProcess>();
  std::mutex faults_mutex;
  std::vector<FailureRecord> faults;
  Supervisor supervisor{"svc"};

  Harness() {
    auto installed = supervisor.set_launcher_factory(testing::fake_launcher_factory(process));
    EXPECT_TRUE(installed.has_value());
    supervisor.add_fault_handler([this](const FailureRecord& record) {
      std::lock_guard<std::mutex> lock(faults_mutex);
      faults.push_back(record);
    });
  }

  void configure() {
    ASSERT_TRUE(supervisor.configure({{"KEY", "value"}}, {"prog", "arg"}).has_value());
  }

  std::size_t fault_count() {
    std::lock_guard<std::mutex> lock(faults_mutex);
    return faults.size();
  }
};

}  // namespace

TEST(SupervisorTest, ZeroExitProducesNoFailure) {
  Harness h;
  h.process->exit_after = milliseconds(0);
  h.configure();

  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));

  EXPECT_TRUE(h.supervisor.is_process_started());
  EXPECT_TRUE(h.supervisor.is_process_terminated());
  EXPECT_FALSE(h.supervisor.is_process_running());
  EXPECT_EQ(h.supervisor.exit_code(), 0);
  EXPECT_EQ(h.supervisor.exit_code_sign_corrected(), 0);
  EXPECT_FALSE(h.supervisor.failure().has_value());
  EXPECT_EQ(h.fault_count(), 0u);
  EXPECT_EQ(h.supervisor.state(), ServiceState::stopped);
  EXPECT_EQ(h.supervisor.phase(), RunPhase::completed_ok);
  EXPECT_EQ(h.process->stop_calls.load(), 0);
}

TEST(SupervisorTest, NonZeroExitProducesExactlyOneFailure) {
  Harness h;
  h.process->exit_after = milliseconds(0);
  h.process->exit_raw = 3;
  h.process->exit_corrected = 3;
  h.configure();

  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));
  h.supervisor.stop();

  auto failure = h.supervisor.failure();
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, FailureKind::exit);
  EXPECT_EQ(failure->code, 3);
  EXPECT_EQ(failure->message, "svc failed with code 3");
  EXPECT_EQ(failure->to_error().code, make_error_code(errc::process_exit_failure));
  EXPECT_EQ(h.fault_count(), 1u);
  EXPECT_EQ(h.supervisor.phase(), RunPhase::completed_failed);
}

TEST(SupervisorTest, SignalledExitUsesCorrectedCode) {
  Harness h;
  h.process->exit_after = milliseconds(0);
  h.process->exit_raw = -9;
  h.process->exit_corrected = 137;
  h.configure();

  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));

  EXPECT_EQ(h.supervisor.exit_code(), -9);
  EXPECT_EQ(h.supervisor.exit_code_sign_corrected(), 137);
  ASSERT_TRUE(h.supervisor.failure().has_value());
  EXPECT_EQ(h.supervisor.failure()->code, 137);
}

TEST(SupervisorTest, TimeoutReportsTimeoutCodeAndTerminatesOnce) {
  Harness h;
  h.process->stopped_raw = -15;
  h.process->stopped_corrected = 143;
  h.configure();
  h.supervisor.set_timeout(milliseconds(100), 124);

  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));

  auto failure = h.supervisor.failure();
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, FailureKind::timeout);
  EXPECT_EQ(failure->code, 124);
  EXPECT_EQ(failure->message, "svc: timeout after 100 millis: exit code =124");
  EXPECT_EQ(h.fault_count(), 1u);
  EXPECT_EQ(h.process->stop_calls.load(), 1);
  EXPECT_EQ(h.supervisor.phase(), RunPhase::timed_out);
  EXPECT_TRUE(h.supervisor.is_process_terminated());
}

TEST(SupervisorTest, TimeoutCodeIsFixedWhenTheRunStarts) {
  Harness h;
  h.configure();
  h.supervisor.set_timeout(milliseconds(200), 124);

  ASSERT_TRUE(h.supervisor.start().has_value());
  for (int i = 0; i < 100 && !h.supervisor.is_process_started(); ++i) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  ASSERT_TRUE(h.supervisor.is_process_started());
  h.supervisor.set_timeout(milliseconds(200), 99);
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));

  auto failure = h.supervisor.failure();
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, FailureKind::timeout);
  EXPECT_EQ(failure->code, 124);
  EXPECT_EQ(h.supervisor.timeout().exit_code, 99);
}

TEST(SupervisorTest, ExitBeforeDeadlineWinsTheRace) {
  Harness h;
  h.process->exit_after = milliseconds(10);
  h.configure();
  h.supervisor.set_timeout(milliseconds(500), 124);

  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));
  // Give a wrongly armed watcher the chance to fire.
  std::this_thread::sleep_for(milliseconds(600));

  EXPECT_FALSE(h.supervisor.failure().has_value());
  EXPECT_EQ(h.fault_count(), 0u);
  EXPECT_EQ(h.process->stop_calls.load(), 0);
  EXPECT_EQ(h.supervisor.phase(), RunPhase::completed_ok);
}

TEST(SupervisorTest, StartWithoutConfigureFailsWithoutCreatingLauncher) {
  Harness h;
  auto started = h.supervisor.start();
  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error().code, make_error_code(errc::not_configured));
  EXPECT_EQ(h.process->launchers_created.load(), 0);
  EXPECT_FALSE(h.supervisor.is_process_started());
  EXPECT_EQ(h.supervisor.state(), ServiceState::stopped);
  EXPECT_EQ(h.supervisor.phase(), RunPhase::stopped);
}

TEST(SupervisorTest, ConfigureTwiceFails) {
  Harness h;
  h.configure();
  auto again = h.supervisor.configure({}, {"other"});
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, make_error_code(errc::already_configured));
  EXPECT_EQ(h.process->launchers_created.load(), 1);
  EXPECT_EQ(h.process->command, (std::vector<std::string>{"prog", "arg"}));
}

TEST(SupervisorTest, ConfigurePassesEnvironmentToLauncher) {
  Harness h;
  h.configure();
  EXPECT_TRUE(h.supervisor.is_configured());
  EXPECT_EQ(h.process->env.at("KEY"), "value");
}

TEST(SupervisorTest, EmptyCommandIsRejected) {
  Harness h;
  auto result = h.supervisor.configure({}, {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::empty_argv));
  EXPECT_FALSE(h.supervisor.is_configured());
}

TEST(SupervisorTest, ConfiguringConstructorThrowsOnEmptyCommand) {
  EXPECT_THROW(Supervisor("svc", Environment{}, std::vector<std::string>{}), std::runtime_error);
}

TEST(SupervisorTest, LauncherFactoryCannotChangeAfterConfigure) {
  Harness h;
  h.configure();
  auto result = h.supervisor.set_launcher_factory(testing::fake_launcher_factory(h.process));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::already_configured));
}

TEST(SupervisorTest, LauncherStartFailureStopsService) {
  Harness h;
  h.process->start_error = Error{make_error_code(errc::spawn_failed), "spawn"};
  h.configure();
  auto started = h.supervisor.start();
  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error().code, make_error_code(errc::spawn_failed));
  EXPECT_EQ(h.supervisor.state(), ServiceState::stopped);
  EXPECT_FALSE(h.supervisor.failure().has_value());
}

TEST(SupervisorTest, StopIsIdempotentAndNeverAFailure) {
  Harness h;
  h.configure();
  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.process->wait_running(kStopWait));

  h.supervisor.stop();
  h.supervisor.stop();
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));

  EXPECT_TRUE(h.supervisor.is_process_terminated());
  EXPECT_FALSE(h.supervisor.failure().has_value());
  EXPECT_EQ(h.fault_count(), 0u);
  EXPECT_EQ(h.process->stop_calls.load(), 1);
  EXPECT_EQ(h.supervisor.phase(), RunPhase::stopped);
}

TEST(SupervisorTest, StopWakesWatcherBeforeDeadline) {
  Harness h;
  h.configure();
  h.supervisor.set_timeout(std::chrono::seconds(30), 124);
  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.process->wait_running(kStopWait));

  auto begin = std::chrono::steady_clock::now();
  h.supervisor.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
  EXPECT_FALSE(h.supervisor.failure().has_value());
}

TEST(SupervisorTest, RecentOutputEmptyBeforeConfigure) {
  Supervisor supervisor("svc");
  EXPECT_TRUE(supervisor.recent_output().empty());
  EXPECT_TRUE(supervisor.recent_output(true, milliseconds(10)).empty());
  EXPECT_FALSE(supervisor.exit_code().has_value());
  EXPECT_EQ(supervisor.exit_code_sign_corrected(), -1);
  EXPECT_EQ(supervisor.phase(), RunPhase::not_configured);
}

TEST(SupervisorTest, RecentOutputPassesThrough) {
  Harness h;
  h.process->output = {"one", "two"};
  h.configure();
  EXPECT_EQ(h.supervisor.recent_output(), (std::vector<std::string>{"one", "two"}));
  EXPECT_EQ(h.supervisor.recent_output(false, milliseconds(0)),
            (std::vector<std::string>{"one", "two"}));
}

TEST(SupervisorTest, OutputSettingsReachLauncherBeforeAndAfterConfigure) {
  std::ostringstream sink_stream;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(sink_stream);
  auto log = std::make_shared<spdlog::logger>("svc-output", sink);

  Harness before;
  before.supervisor.set_output_log(log);
  before.supervisor.set_recent_line_limit(5);
  before.configure();
  EXPECT_EQ(before.process->output_log, log);
  EXPECT_EQ(before.process->line_limit, 5u);

  Harness after;
  after.configure();
  EXPECT_FALSE(after.process->line_limit.has_value());
  after.supervisor.set_recent_line_limit(7);
  after.supervisor.set_output_log(nullptr);
  EXPECT_EQ(after.process->line_limit, 7u);
  EXPECT_TRUE(after.process->output_log_set);
  EXPECT_EQ(after.process->output_log, nullptr);
}

TEST(SupervisorTest, TimeoutDefaultsToUnbounded) {
  Supervisor supervisor("svc");
  EXPECT_EQ(supervisor.timeout().duration, TimeoutConfig::kUnbounded);
  EXPECT_EQ(supervisor.timeout().exit_code, TimeoutConfig::kDefaultTimeoutCode);
  supervisor.set_timeout(milliseconds(250), 9);
  EXPECT_EQ(supervisor.timeout().duration, milliseconds(250));
  EXPECT_EQ(supervisor.timeout().exit_code, 9);
}

TEST(SupervisorTest, PhaseFollowsTheRun) {
  Harness h;
  EXPECT_EQ(h.supervisor.phase(), RunPhase::not_configured);
  h.configure();
  EXPECT_EQ(h.supervisor.phase(), RunPhase::configured);
  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.process->wait_running(kStopWait));
  // started_ is published by the start notification, just after the fake reports running.
  for (int i = 0; i < 100 && !h.supervisor.is_process_started(); ++i) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  EXPECT_EQ(h.supervisor.phase(), RunPhase::started);
  EXPECT_TRUE(h.supervisor.is_process_running());

  h.process->exit(0, 0);
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));
  EXPECT_EQ(h.supervisor.phase(), RunPhase::completed_ok);
  EXPECT_STREQ(to_string(h.supervisor.phase()), "completed_ok");
}

TEST(SupervisorTest, FaultHandlerMayStopTheService) {
  Harness h;
  std::atomic<int> calls{0};
  h.supervisor.add_fault_handler([&](const FailureRecord&) {
    ++calls;
    h.supervisor.stop();
  });
  h.process->exit_after = milliseconds(0);
  h.process->exit_corrected = 2;
  h.configure();

  ASSERT_TRUE(h.supervisor.start().has_value());
  ASSERT_TRUE(h.supervisor.wait_for_service_to_stop(kStopWait));
  EXPECT_EQ(calls.load(), 1);
}

}  // namespace procsup
