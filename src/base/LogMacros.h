// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef FILEIO_BASE_LOGMACROS_H_
#define FILEIO_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/Logging.h"

#ifdef DISABLE_FILEIO_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)

#else  // !DISABLE_FILEIO_LOGGING
// glog buffers INFO stream, flush it after every non-fatal message so the
// log files are complete when a test reads them back.
#define FILEIO_LOG_STREAM(severity, level, msg)                             \
  {                                                                         \
    LOG(severity) << FIO::Logging::GetLogLevelPrefix(                       \
                         FIO::Logging::LogLevel::level)                     \
                  << msg;                                                   \
    google::FlushLogFiles(google::INFO);                                    \
  }

#define FILEIO_LOG_STREAM_IF(severity, level, condition, msg)               \
  {                                                                         \
    LOG_IF(severity, (condition)) << FIO::Logging::GetLogLevelPrefix(       \
                                         FIO::Logging::LogLevel::level)     \
                                  << msg;                                   \
    google::FlushLogFiles(google::INFO);                                    \
  }

#define FILEIO_IS_DEBUG() (FIO::Logging::Log::Instance().IsDebug())

#define Info(msg) FILEIO_LOG_STREAM(INFO, Info, msg)
#define Warning(msg) FILEIO_LOG_STREAM(WARNING, Warn, msg)
#define Error(msg) FILEIO_LOG_STREAM(ERROR, Error, msg)
#define Fatal(msg)                                                            \
  LOG(FATAL) << FIO::Logging::GetLogLevelPrefix(FIO::Logging::LogLevel::Fatal) \
             << msg;

#define InfoIf(condition, msg) FILEIO_LOG_STREAM_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) \
  FILEIO_LOG_STREAM_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) \
  FILEIO_LOG_STREAM_IF(ERROR, Error, condition, msg)
#define FatalIf(condition, msg)                                   \
  LOG_IF(FATAL, (condition)) << FIO::Logging::GetLogLevelPrefix(  \
                                    FIO::Logging::LogLevel::Fatal) \
                             << msg;

#define DebugInfo(msg) \
  FILEIO_LOG_STREAM_IF(INFO, Info, FILEIO_IS_DEBUG(), msg)
#define DebugWarning(msg) \
  FILEIO_LOG_STREAM_IF(WARNING, Warn, FILEIO_IS_DEBUG(), msg)
#define DebugError(msg) \
  FILEIO_LOG_STREAM_IF(ERROR, Error, FILEIO_IS_DEBUG(), msg)

#define DebugInfoIf(condition, msg) \
  FILEIO_LOG_STREAM_IF(INFO, Info, FILEIO_IS_DEBUG() && (condition), msg)
#define DebugWarningIf(condition, msg) \
  FILEIO_LOG_STREAM_IF(WARNING, Warn, FILEIO_IS_DEBUG() && (condition), msg)
#define DebugErrorIf(condition, msg) \
  FILEIO_LOG_STREAM_IF(ERROR, Error, FILEIO_IS_DEBUG() && (condition), msg)

#endif  // DISABLE_FILEIO_LOGGING

#endif  // FILEIO_BASE_LOGMACROS_H_
