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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror
#include <unistd.h>

#include <string>

#include "boost/bind.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace FIO {

namespace Logging {

using FIO::Exception::FIOException;
using std::string;

namespace {

boost::once_flag instanceOnce = BOOST_ONCE_INIT;
boost::once_flag initOnce = BOOST_ONCE_INIT;
boost::scoped_ptr<Log> instance;

void InitializeGLog() {
  google::InitGoogleLogging(FIO::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
}

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  switch (logLevel) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Fatal:
      return "FATAL";
    default:
      return string();
  }
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  string upper = FIO::StringUtils::ToUpper(FIO::StringUtils::Trim(name, ' '));
  if (upper == "WARN" || upper == "WARNING") {
    return LogLevel::Warn;
  } else if (upper == "ERROR") {
    return LogLevel::Error;
  } else if (upper == "FATAL") {
    return LogLevel::Fatal;
  }
  return LogLevel::Info;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

// --------------------------------------------------------------------------
Log &Log::Instance() {
  boost::call_once(instanceOnce, &Log::CreateInstance);
  return *instance;
}

// --------------------------------------------------------------------------
void Log::CreateInstance() { instance.reset(new Log); }

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir) {
  boost::call_once(initOnce, boost::bind(boost::type<void>(),
                                         &Log::DoInitialize, this, logdir));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir) {
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
    FLAGS_colorlogtostderr = true;
  } else {
    m_logDirectory = logdir;
    // glog reads the destination flags when InitGoogleLogging is called,
    // so they must be set before it.
    FLAGS_log_dir = logdir.c_str();
    FLAGS_max_log_size = FIO::Configure::Default::GetMaxLogSizeInMB();
    FLAGS_stop_logging_if_full_disk = true;

    if (!FIO::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw FIOException("Unable to create log directory " + logdir + " : " +
                         strerror(errno));
    }
    if (access(logdir.c_str(), W_OK) != 0) {
      throw FIOException("Could not create logging file at " + logdir +
                         ": Permission denied");
    }
  }

  InitializeGLog();
}

}  // namespace Logging
}  // namespace FIO
