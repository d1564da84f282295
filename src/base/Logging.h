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

#ifndef FILEIO_BASE_LOGGING_H_
#define FILEIO_BASE_LOGGING_H_

#include <string>

#include "boost/noncopyable.hpp"

namespace FIO {

namespace Logging {

struct LogLevel {
  enum Value { Info = 0, Warn = 1, Error = 2, Fatal = 3 };
};

// Get log level name, e.g. "INFO"
std::string GetLogLevelName(LogLevel::Value logLevel);

// Get log level by name, case insensitive
//
// Return Info if name not belongs to {INFO, WARN, ERROR, FATAL}
LogLevel::Value GetLogLevelByName(const std::string &name);

// Get log level prefix, e.g. "[INFO] "
std::string GetLogLevelPrefix(LogLevel::Value logLevel);

//
// Log
//
// Process wide wrapper of glog.
// Call Initialize once to get log ready. Specify a directory to log message
// to files under it, or log message to console with no specifying.
//
class Log : private boost::noncopyable {
 public:
  static Log &Instance();

  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_isDebug; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }

  // Initialize
  //
  // @param  : log dir, log to console if empty
  // @return : none
  //
  // One-time initialization, later calls are no-op.
  // Throws FIOException if log directory cannot be created.
  void Initialize(const std::string &logdir = std::string());

  void SetLogLevel(LogLevel::Value level);
  void SetDebug(bool debug) { m_isDebug = debug; }

 private:
  Log()
      : m_logLevel(LogLevel::Info),
        m_logDirectory(std::string()),
        m_isDebug(false) {}

  void DoInitialize(const std::string &logdir);
  static void CreateInstance();

  LogLevel::Value m_logLevel;
  std::string m_logDirectory;  // log to console if it's empty
  bool m_isDebug;

  friend class LoggingTest;
  friend class FatalLoggingDeathTest;
};

}  // namespace Logging
}  // namespace FIO

#endif  // FILEIO_BASE_LOGGING_H_
