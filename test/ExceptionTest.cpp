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
#include <string>

#include "gtest/gtest.h"

#include "base/Exception.h"

namespace {

using FIO::Exception::CancelledError;
using FIO::Exception::FIOException;
using FIO::Exception::InvalidPathError;
using FIO::Exception::MultipartAbortError;
using FIO::Exception::TimeoutError;
using FIO::Exception::TransferError;
using FIO::Exception::UnknownSchemeError;
using std::string;

static const char *const testMsg = "test FIOException";

void ThrowException() { throw FIOException(testMsg); }

string GetExceptionMsg() {
  try {
    ThrowException();
  } catch (const FIOException &err) {
    return err.get();
  }
  return string();
}

bool Contains(const string &str, const string &sub) {
  return str.find(sub) != string::npos;
}

}  // namespace

TEST(FIOExceptionTest, DefaultTest) {
  EXPECT_EQ(GetExceptionMsg(), string(testMsg));
}

TEST(FIOExceptionTest, CaughtAsBase) {
  try {
    throw UnknownSchemeError("gcs");
  } catch (const FIOException &err) {
    EXPECT_TRUE(Contains(err.what(), "UnknownSchemeError"));
    EXPECT_TRUE(Contains(err.what(), "[gcs]"));
  }
}

TEST(FIOExceptionTest, TransferErrorContext) {
  TransferError err("s3://bucket/key", 3, 4, "SERVER_ERROR", 10, true);
  EXPECT_EQ("s3://bucket/key", err.GetPath());
  EXPECT_EQ(3, err.GetChunkIndex());
  EXPECT_EQ(4, err.GetAttempts());
  EXPECT_EQ("SERVER_ERROR", err.GetCause());
  EXPECT_EQ(10, err.GetErrorCode());
  EXPECT_TRUE(err.IsRetryable());
  EXPECT_TRUE(err.GetCleanupError().empty());
  EXPECT_TRUE(Contains(err.what(), "chunk=3"));
  EXPECT_TRUE(Contains(err.what(), "attempts=4"));

  TransferError whole("a.txt", TransferError::kNoChunk, 1, "NOT_FOUND");
  EXPECT_TRUE(Contains(whole.what(), "chunk=none"));
  EXPECT_FALSE(whole.IsRetryable());

  err.SetCleanupError("abort failed");
  EXPECT_EQ("abort failed", err.GetCleanupError());
}

TEST(FIOExceptionTest, OtherErrors) {
  InvalidPathError pathErr("s3://", "missing container");
  EXPECT_EQ("s3://", pathErr.GetPath());
  EXPECT_TRUE(Contains(pathErr.what(), "missing container"));

  MultipartAbortError abortErr("s3://b/k", "upload-1", "ACCESS_DENIED");
  EXPECT_EQ("upload-1", abortErr.GetUploadId());
  EXPECT_TRUE(Contains(abortErr.what(), "ACCESS_DENIED"));

  TimeoutError timeout("s3://b/k", 500);
  EXPECT_TRUE(Contains(timeout.what(), "500ms"));

  CancelledError cancelled("s3://b/k");
  EXPECT_EQ("s3://b/k", cancelled.GetPath());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
