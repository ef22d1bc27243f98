/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef _ERROR_HANDLING_H
#define _ERROR_HANDLING_H

#include <string>

#define MAX_ERR_LEN 255

#define UNRECOVERABLE_FAIL -1
#define RECOVERABLE_FAIL -2
#define RECOVERABLE_ERROR_CODES -200


enum class ErrorCode : int {
  None = 0,
  IllegalConfiguration = -1,
  PathDoesNotExist = -2,
  NotAnAbsolutePath = -3,
  LogFileNotUnique = -4,
  InvalidToolchainSpec = -5,
  FileReadAndWrite = -6,
  ToolchainUnavailable = -10,
  VersionMismatch = -11,
  SandboxSetupError = -12,
  PrivilegeDropFailed = -13,
  GeneralOSError = -100,
  // Error codes from -201 are recoverables
  CommitFailed = -201,
  Unknown = -1000
};

inline std::string GetErrorMessage(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return ": No error";
    case ErrorCode::IllegalConfiguration:
      return " : Illegal configuration";
    case ErrorCode::PathDoesNotExist:
      return " : Path does not exist";
    case ErrorCode::NotAnAbsolutePath:
      return " : Must use absolute paths";
    case ErrorCode::LogFileNotUnique:
      return " : Cannot write debug output to more than one file";
    case ErrorCode::InvalidToolchainSpec:
      return " : Toolchain version must be pinned exactly";
    case ErrorCode::FileReadAndWrite:
      return " : Illegal configuration. Path mounted as read and write at the same time";
    case ErrorCode::ToolchainUnavailable:
      return " : Pinned toolchain could not be installed";
    case ErrorCode::VersionMismatch:
      return " : Installed toolchain does not match the pinned version";
    case ErrorCode::SandboxSetupError:
      return " : Sandbox could not be set up on this host";
    case ErrorCode::PrivilegeDropFailed:
      return " : Could not drop privileges";
    case ErrorCode::CommitFailed:
      return " : Could not commit workspace changes";
    case ErrorCode::GeneralOSError:
      return " : OS Error";
    case ErrorCode::Unknown:
    default:
      return ": Unknown error occurred";
  }
}

// Stable names used in reports.
const char* GetErrorName(ErrorCode code);

inline bool IsRecoverable(ErrorCode code) {
  return static_cast<int>(code) < RECOVERABLE_ERROR_CODES;
}

typedef struct {
  char msg[MAX_ERR_LEN];
  ErrorCode code;
} TbxError;

#define TbxReportGenericError(msg) \
    TbxReportGenericError_impl((msg), __FILE__, __LINE__, __func__)

int TbxReportGenericError_impl(const std::string& err_msg, const char* file, int line, const char* func);

// Like TbxReportGenericError but appends strerror(errno).
#define TbxReportSysError(msg) \
    TbxReportSysError_impl((msg), __FILE__, __LINE__, __func__)

int TbxReportSysError_impl(const std::string& err_msg, const char* file, int line, const char* func);

#define TbxReportError(code) \
    TbxReportError_impl((code), __FILE__, __LINE__, __func__)

int TbxReportError_impl(ErrorCode code, const char* file, int line, const char* func);

#define TbxReportErrorAndMessage(msg, code) \
    TbxReportErrorAndMessage_impl((msg), (code), __FILE__, __LINE__, __func__)

int TbxReportErrorAndMessage_impl(std::string err_msg, ErrorCode code, const char* file, int line, const char* func);

// Stores an already formatted message, e.g. one received from a sandbox child.
int TbxSetError(const std::string& msg, ErrorCode code);

TbxError TbxGetLastError();
const char* TbxGetErrorMsg();
int TbxGetErrorCode();
void TbxClearError();

#endif
