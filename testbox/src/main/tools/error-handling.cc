/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */


#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

#include <cerrno>
#include <cstring>


// Each run keeps its own last error; runs on different threads never see
// each other's failures.
static thread_local TbxError sbx_err = {{0}, ErrorCode::None};


const char* GetErrorName(ErrorCode code) {
  switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::IllegalConfiguration: return "IllegalConfiguration";
    case ErrorCode::PathDoesNotExist: return "PathDoesNotExist";
    case ErrorCode::NotAnAbsolutePath: return "NotAnAbsolutePath";
    case ErrorCode::LogFileNotUnique: return "LogFileNotUnique";
    case ErrorCode::InvalidToolchainSpec: return "InvalidToolchainSpec";
    case ErrorCode::FileReadAndWrite: return "FileReadAndWrite";
    case ErrorCode::ToolchainUnavailable: return "ToolchainUnavailable";
    case ErrorCode::VersionMismatch: return "VersionMismatch";
    case ErrorCode::SandboxSetupError: return "SandboxSetupError";
    case ErrorCode::PrivilegeDropFailed: return "PrivilegeDropFailed";
    case ErrorCode::GeneralOSError: return "GeneralOSError";
    case ErrorCode::CommitFailed: return "CommitFailed";
    case ErrorCode::Unknown:
    default:
      return "Unknown";
  }
}


static void GenErrorMessage(const std::string& err_msg, const char* file,
                            int line, const char* func, std::string& out) {
  out = "[" + std::string(func) + ":" + std::to_string(line) + "]" + err_msg;
}


int TbxSetError(const std::string& msg, ErrorCode code) {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  strncpy(sbx_err.msg, msg.c_str(), MAX_ERR_LEN - 1);
  sbx_err.code = code;
  PRINT_DEBUG("error %s: %s", GetErrorName(code), sbx_err.msg);
  return IsRecoverable(code) ? RECOVERABLE_FAIL : UNRECOVERABLE_FAIL;
}


int TbxReportGenericError_impl(const std::string& err_msg, const char* file, int line, const char* func) {
  return TbxReportErrorAndMessage_impl(err_msg, ErrorCode::GeneralOSError, file, line, func);
}


int TbxReportSysError_impl(const std::string& err_msg, const char* file, int line, const char* func) {
  const int saved_errno = errno;
  return TbxReportErrorAndMessage_impl(err_msg + ": " + strerror(saved_errno),
                                       ErrorCode::GeneralOSError, file, line, func);
}


int TbxReportError_impl(ErrorCode code, const char* file, int line, const char* func) {
  return TbxReportErrorAndMessage_impl("", code, file, line, func);
}


int TbxReportErrorAndMessage_impl(std::string err_msg, ErrorCode code, const char* file, int line, const char* func) {
  std::string msg;
  std::string code_msg = GetErrorMessage(code);
  if (!err_msg.empty())
    code_msg += ": " + err_msg;

  GenErrorMessage(code_msg, file, line, func, msg);
  return TbxSetError(msg, code);
}


TbxError TbxGetLastError() {
  return sbx_err;
}


const char* TbxGetErrorMsg() {
  return sbx_err.msg;
}


int TbxGetErrorCode() {
  return static_cast<int>(sbx_err.code);
}


void TbxClearError() {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  sbx_err.code = ErrorCode::None;
}
