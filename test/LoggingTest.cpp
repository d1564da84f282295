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
#include <stdio.h>     // for fopen
#include <sys/stat.h>  // for stat

#include <fstream>
#include <ostream>
#include <string>
#include <vector>

#include "boost/function.hpp"
#include "gtest/gtest.h"

#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Utils.h"

namespace FIO {

namespace Logging {

// glog links fileio.INFO and fileio.FATAL to the latest log files of each
// severity, the checks below read them back.

// Fixtures live in the namespace of Log to be its friends.

using std::fstream;
using std::ostream;
using std::string;
using std::vector;
using ::testing::Values;
using ::testing::WithParamInterface;

static const char *defaultLogDir = "/tmp/fileio.test.logs/";
const char *infoLogFile = "/tmp/fileio.test.logs/fileio.INFO";
const char *fatalLogFile = "/tmp/fileio.test.logs/fileio.FATAL";

void MakeDefaultLogDir() {
  bool success = FIO::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  ASSERT_TRUE(success) << "Fail to create directory " << defaultLogDir;
}

void ClearFileContent(const std::string &path) {
  FILE *pf = fopen(path.c_str(), "w");
  if (pf != NULL) {
    fclose(pf);
  }
}

void LogNonFatalPossibilities() {
  Error("test Error");
  ErrorIf(true, "test ErrorIf");
  ErrorIf(false, "test ErrorIf skipped");
  DebugError("test DebugError");
  DebugErrorIf(true, "test DebugErrorIf");
  Warning("test Warning " << 1);
  WarningIf(true, "test WarningIf");
  DebugWarning("test DebugWarning");
  DebugWarningIf(true, "test DebugWarningIf");
  Info("test Info");
  InfoIf(true, "test InfoIf");
  DebugInfo("test DebugInfo");
  DebugInfoIf(true, "test DebugInfoIf");
}

void RemoveLastLines(vector<string> &expectedMsgs, int count) {  // NOLINT
  for (int i = 0; i < count && (!expectedMsgs.empty()); ++i) {
    expectedMsgs.pop_back();
  }
}

void VerifyAllNonFatalLogs(LogLevel::Value level) {
  struct stat info;
  int status = stat(infoLogFile, &info);
  ASSERT_EQ(status, 0) << infoLogFile << " is not existing";

  vector<string> logMsgs;
  {
    fstream fs(infoLogFile);
    ASSERT_TRUE(fs.is_open()) << "Fail to open " << infoLogFile;

    string::size_type pos = string::npos;
    for (string line; std::getline(fs, line);) {
      if ((pos = line.find("[INFO]")) != string::npos ||
          (pos = line.find("[WARN]")) != string::npos ||
          (pos = line.find("[ERROR]")) != string::npos) {
        logMsgs.push_back(string(line, pos));
      }
    }
  }

  vector<string> expectedMsgs;
  expectedMsgs.push_back("[ERROR] test Error");
  expectedMsgs.push_back("[ERROR] test ErrorIf");
  expectedMsgs.push_back("[ERROR] test DebugError");
  expectedMsgs.push_back("[ERROR] test DebugErrorIf");
  expectedMsgs.push_back("[WARN] test Warning 1");
  expectedMsgs.push_back("[WARN] test WarningIf");
  expectedMsgs.push_back("[WARN] test DebugWarning");
  expectedMsgs.push_back("[WARN] test DebugWarningIf");
  expectedMsgs.push_back("[INFO] test Info");
  expectedMsgs.push_back("[INFO] test InfoIf");
  expectedMsgs.push_back("[INFO] test DebugInfo");
  expectedMsgs.push_back("[INFO] test DebugInfoIf");

  if (level == LogLevel::Warn) {
    RemoveLastLines(expectedMsgs, 4);
  } else if (level == LogLevel::Error) {
    RemoveLastLines(expectedMsgs, 8);
  }

  EXPECT_EQ(logMsgs, expectedMsgs);
}

class LoggingTest : public ::testing::Test {
 public:
  LoggingTest() {}

  static void SetUpTestCase() {
    MakeDefaultLogDir();
    Log::Instance().Initialize(defaultLogDir);
  }

  ~LoggingTest() {}

 protected:
  void TestNonFatalLogs(LogLevel::Value level) {
    Log::Instance().SetDebug(true);
    Log::Instance().SetLogLevel(level);
    EXPECT_EQ(level, Log::Instance().m_logLevel);
    ClearFileContent(infoLogFile);  // make sure only contain logs of this test
    LogNonFatalPossibilities();
    VerifyAllNonFatalLogs(level);
  }

  void TestDebugOff() {
    Log::Instance().SetDebug(false);
    Log::Instance().SetLogLevel(LogLevel::Info);
    ClearFileContent(infoLogFile);
    DebugInfo("test DebugInfo");
    DebugError("test DebugError");
    Info("test Info");

    vector<string> logMsgs;
    fstream fs(infoLogFile);
    ASSERT_TRUE(fs.is_open()) << "Fail to open " << infoLogFile;
    string::size_type pos = string::npos;
    for (string line; std::getline(fs, line);) {
      if ((pos = line.find("test ")) != string::npos) {
        logMsgs.push_back(string(line, pos));
      }
    }
    ASSERT_EQ(1u, logMsgs.size());
    EXPECT_EQ("test Info", logMsgs[0]);
  }

  void TestInitializeOnce() {
    string dir = Log::Instance().GetLogDirectory();
    Log::Instance().Initialize("/tmp/fileio.test.logs.other/");
    EXPECT_EQ(dir, Log::Instance().GetLogDirectory());
  }
};

// Test Cases
TEST_F(LoggingTest, NonFatalLogsLevelInfo) { TestNonFatalLogs(LogLevel::Info); }

TEST_F(LoggingTest, NonFatalLogsLevelWarn) { TestNonFatalLogs(LogLevel::Warn); }

TEST_F(LoggingTest, NonFatalLogsLevelError) {
  TestNonFatalLogs(LogLevel::Error);
}

TEST_F(LoggingTest, DebugOff) { TestDebugOff(); }

TEST_F(LoggingTest, InitializeOnce) { TestInitializeOnce(); }

TEST(LogLevelTest, LogLevelName) {
  EXPECT_EQ(string("INFO"), GetLogLevelName(LogLevel::Info));
  EXPECT_EQ(string("WARN"), GetLogLevelName(LogLevel::Warn));
  EXPECT_EQ(string("ERROR"), GetLogLevelName(LogLevel::Error));
  EXPECT_EQ(string("FATAL"), GetLogLevelName(LogLevel::Fatal));
  EXPECT_EQ(string("[WARN] "), GetLogLevelPrefix(LogLevel::Warn));
}

TEST(LogLevelTest, LogLevelByName) {
  EXPECT_EQ(LogLevel::Info, GetLogLevelByName("info"));
  EXPECT_EQ(LogLevel::Warn, GetLogLevelByName("warn"));
  EXPECT_EQ(LogLevel::Warn, GetLogLevelByName("WARNING"));
  EXPECT_EQ(LogLevel::Error, GetLogLevelByName("Error"));
  EXPECT_EQ(LogLevel::Fatal, GetLogLevelByName("FATAL"));
  EXPECT_EQ(LogLevel::Info, GetLogLevelByName("verbose"));
}

//
// glog terminates the program on a FATAL message, these are death tests.
//
typedef boost::function<void(bool)> LogFatalFun;

struct LogFatalState {
  LogFatalState(LogFatalFun func, const string &msg, bool cond, bool die)
      : logFatalFunc(func), fatalMsg(msg), condition(cond), willDie(die) {}

  friend ostream &operator<<(ostream &os, const LogFatalState &state) {
    return os << "[fatalMsg: " << state.fatalMsg
              << ", condition: " << std::boolalpha << state.condition
              << ", will die: " << state.willDie << "]";
  }

  LogFatalFun logFatalFunc;
  string fatalMsg;
  bool condition;  // only effective for *If macros
  bool willDie;
};

void LogFatal(bool condition) { Fatal("test Fatal"); }
void LogFatalIf(bool condition) { FatalIf(condition, "test FatalIf"); }

void VerifyFatalLog(const string &expectedMsg) {
  struct stat info;
  int status = stat(fatalLogFile, &info);
  ASSERT_EQ(status, 0) << fatalLogFile << " is not existing";

  string logMsg;
  {
    fstream fs(fatalLogFile);
    ASSERT_TRUE(fs.is_open()) << "Fail to open " << fatalLogFile;

    string::size_type pos = string::npos;
    for (string line; std::getline(fs, line);) {
      if ((pos = line.find("[FATAL]")) != string::npos) {
        logMsg = string(line, pos);
        break;
      }
    }
  }
  EXPECT_EQ(logMsg, expectedMsg);
}

class FatalLoggingDeathTest : public LoggingTest,
                              public WithParamInterface<LogFatalState> {
 public:
  void SetUp() {  // override
    MakeDefaultLogDir();
    m_fatalMsg = GetParam().fatalMsg;
  }

 protected:
  void TestWithIf() {
    LogFatalFun func = GetParam().logFatalFunc;
    bool condition = GetParam().condition;
    // the test dies only when the fatal message is logged
    if (GetParam().willDie) {
      ASSERT_DEATH({ func(condition); }, "");
    } else {
      func(condition);
    }
    VerifyFatalLog(m_fatalMsg);
  }

 protected:
  string m_fatalMsg;
};

TEST_P(FatalLoggingDeathTest, WithIf) { TestWithIf(); }

// A skipped FatalIf flushes nothing, the last fatal message stays in file.
INSTANTIATE_TEST_CASE_P(
    LogFatal, FatalLoggingDeathTest,
    // logFun, expectMsg, condition, will die
    Values(LogFatalState(LogFatal, "[FATAL] test Fatal", true, true),
           LogFatalState(LogFatalIf, "[FATAL] test FatalIf", true, true),
           LogFatalState(LogFatalIf, "[FATAL] test FatalIf", false, false)));

}  // namespace Logging
}  // namespace FIO

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
