/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/result-reporter.h"
#include "src/main/tools/logging.h"

#include <string.h>

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

const char* RunStateName(RunState state) {
  switch (state) {
    case RunState::Pending: return "Pending";
    case RunState::Building: return "Building";
    case RunState::Testing: return "Testing";
    case RunState::BuildFailed: return "BuildFailed";
    case RunState::TestsPassed: return "TestsPassed";
    case RunState::TestsFailed: return "TestsFailed";
    case RunState::Timeout: return "Timeout";
    case RunState::Crashed: return "Crashed";
  }
  return "Unknown";
}


bool IsTerminal(RunState state) {
  return state != RunState::Pending && state != RunState::Building &&
         state != RunState::Testing;
}


RunState Classify(int exit_code, int signal, bool timed_out) {
  if (timed_out) return RunState::Timeout;
  if (signal != 0) return RunState::Crashed;
  if (exit_code == 0) return RunState::TestsPassed;
  return RunState::TestsFailed;
}


RunState ClassifyResult(const ExecutionResult& result) {
  return Classify(result.exit_code, result.signal, result.timed_out);
}


int ExitCodeForState(RunState state) {
  switch (state) {
    case RunState::TestsPassed: return EXIT_TESTS_PASSED;
    case RunState::TestsFailed: return EXIT_TESTS_FAILED;
    case RunState::BuildFailed: return EXIT_BUILD_FAILED;
    case RunState::Timeout: return EXIT_TIMEOUT;
    case RunState::Crashed: return EXIT_CRASHED;
    default:
      // A run that never reached a terminal state did not pass.
      return EXIT_SANDBOX_SETUP;
  }
}


int ExitCodeForError(ErrorCode code) {
  switch (code) {
    case ErrorCode::ToolchainUnavailable: return EXIT_TOOLCHAIN_UNAVAILABLE;
    case ErrorCode::VersionMismatch: return EXIT_VERSION_MISMATCH;
    case ErrorCode::PrivilegeDropFailed: return EXIT_PRIVILEGE_DROP;
    case ErrorCode::IllegalConfiguration:
    case ErrorCode::PathDoesNotExist:
    case ErrorCode::NotAnAbsolutePath:
    case ErrorCode::LogFileNotUnique:
    case ErrorCode::InvalidToolchainSpec:
    case ErrorCode::FileReadAndWrite:
      return EXIT_USAGE;
    default:
      return EXIT_SANDBOX_SETUP;
  }
}


int ExitCodeForReport(const RunReport& report) {
  if (report.setup_error != ErrorCode::None &&
      !IsRecoverable(report.setup_error)) {
    return ExitCodeForError(report.setup_error);
  }
  return ExitCodeForState(report.state);
}


static json StepToJson(const StepReport& step) {
  json j;
  j["executed"] = step.executed;
  if (!step.executed) return j;
  const ExecutionResult& r = step.result;
  j["classification"] = RunStateName(step.classification);
  j["exit_code"] = r.exit_code;
  j["signal"] = r.signal;
  j["timed_out"] = r.timed_out;
  j["duration_ms"] = r.duration_ms;
  j["stdout"] = r.stdout_output;
  j["stderr"] = r.stderr_output;
  j["stdout_truncated"] = r.stdout_truncated;
  j["stderr_truncated"] = r.stderr_truncated;
  return j;
}


std::string RenderJsonReport(const RunReport& report) {
  json j;
  j["classification"] = RunStateName(report.state);
  j["exit_code"] = ExitCodeForReport(report);
  j["build"] = StepToJson(report.build);
  j["test"] = StepToJson(report.test);
  if (!report.toolchain_name.empty()) {
    j["toolchain"] = {{"name", report.toolchain_name},
                      {"version", report.toolchain_version},
                      {"prefix", report.toolchain_prefix}};
  }
  if (!report.cache_dir.empty()) {
    j["cache_dir"] = report.cache_dir;
  }
  json commit = {{"status", CommitStatusName(report.commit.status)}};
  if (!report.commit.commit_id.empty()) commit["id"] = report.commit.commit_id;
  if (!report.commit.error.empty()) commit["error"] = report.commit.error;
  j["commit"] = commit;
  if (report.setup_error != ErrorCode::None) {
    j["error"] = {{"code", GetErrorName(report.setup_error)},
                  {"message", report.setup_error_msg}};
  }
  // Captured output is arbitrary bytes; never let it abort the report.
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}


int WriteJsonReport(const RunReport& report, const std::string& path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return TbxReportSysError("open report " + path);
  }
  out << RenderJsonReport(report) << "\n";
  out.close();
  if (out.fail()) {
    return TbxReportGenericError("could not write report " + path);
  }
  PRINT_DEBUG("report written to %s", path.c_str());
  return 0;
}


static void PrintStep(const char* name, const StepReport& step, FILE* out) {
  if (!step.executed) {
    fprintf(out, "  %-6s not run\n", name);
    return;
  }
  const ExecutionResult& r = step.result;
  fprintf(out, "  %-6s %s (exit %d", name, RunStateName(step.classification),
          r.exit_code);
  if (r.signal != 0) fprintf(out, ", signal %s", strsignal(r.signal));
  if (r.timed_out) fprintf(out, ", timed out");
  fprintf(out, ", %lld ms)\n", static_cast<long long>(r.duration_ms));
}


void PrintSummary(const RunReport& report, FILE* out) {
  fprintf(out, "testbox: %s\n", RunStateName(report.state));
  if (report.setup_error != ErrorCode::None) {
    fprintf(out, "  error  %s: %s\n", GetErrorName(report.setup_error),
            report.setup_error_msg.c_str());
  }
  if (!report.toolchain_name.empty()) {
    fprintf(out, "  tool   %s %s\n", report.toolchain_name.c_str(),
            report.toolchain_version.c_str());
  }
  PrintStep("build", report.build, out);
  PrintStep("test", report.test, out);
  if (report.commit.status != CommitStatus::NotAttempted) {
    fprintf(out, "  commit %s %s\n", CommitStatusName(report.commit.status),
            report.commit.status == CommitStatus::Failed
                ? report.commit.error.c_str()
                : report.commit.commit_id.c_str());
  }
  fflush(out);
}
