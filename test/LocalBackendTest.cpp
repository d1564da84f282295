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

#include <stdint.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/Backend.h"
#include "client/BackendFactory.h"
#include "client/ClientError.h"
#include "client/LocalBackend.h"
#include "client/ProviderConfig.h"
#include "client/SMBBackend.h"
#include "configure/Default.h"

namespace FIO {

namespace Client {

using boost::make_shared;
using boost::shared_ptr;
using FIO::Configure::Default::GetPartialFileSuffix;
using FIO::Exception::ProviderConfigError;
using FIO::Utils::CreateDirectoryIfNotExists;
using FIO::Utils::FileExists;
using FIO::Utils::RemoveFileIfExists;
using std::ifstream;
using std::ofstream;
using std::string;
using std::stringstream;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/fileio.test.logs/";
static const char *localDir = "/tmp/fileio.test.local";
static const char *smbRoot = "/tmp/fileio.test.smb";

void InitLog() {
  FIO::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  FIO::Logging::Log::Instance().Initialize(defaultLogDir);
}

string ReadFile(const string &path) {
  ifstream in(path.c_str(), std::ios::binary);
  stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void WriteFile(const string &path, const string &data) {
  ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
  out << data;
}

shared_ptr<const ProviderConfig> MakeConfig(ProviderFamily::Value family,
                                            const string &scheme,
                                            const string &mountRoot) {
  ProviderSettings settings;
  settings.scheme = scheme;
  settings.providerName = family == ProviderFamily::SMB ? "SMB" : "LOCAL";
  settings.family = family;
  settings.mountRoot = mountRoot;
  return make_shared<ProviderConfig>(settings);
}

class LocalBackendTest : public Test {
 protected:
  static void SetUpTestCase() {
    InitLog();
    CreateDirectoryIfNotExists(localDir);
    CreateDirectoryIfNotExists(smbRoot);
  }

  void SetUp() {
    m_backend = make_shared<LocalBackend>(
        MakeConfig(ProviderFamily::Local, "file", ""));
  }

  ObjectLocation Local(const string &name) const {
    return ObjectLocation("", string(localDir) + "/" + name);
  }

  shared_ptr<LocalBackend> m_backend;
};

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, WriteIsAtomic) {
  ObjectLocation loc = Local("atomic.txt");
  RemoveFileIfExists(loc.key);

  string writeId;
  ASSERT_TRUE(m_backend->BeginWrite(loc, 10, &writeId).IsGood());
  EXPECT_EQ(1u, m_backend->GetPendingWriteCount());
  string partial = loc.key + "." + writeId + GetPartialFileSuffix();
  EXPECT_TRUE(FileExists(partial));

  // chunks in any order
  EXPECT_TRUE(m_backend->WriteChunk(loc, writeId, 5, "56789", 5).IsGood());
  EXPECT_TRUE(m_backend->WriteChunk(loc, writeId, 0, "01234", 5).IsGood());
  EXPECT_FALSE(FileExists(loc.key));

  ASSERT_TRUE(m_backend->CommitWrite(loc, writeId).IsGood());
  EXPECT_FALSE(FileExists(partial));
  EXPECT_EQ("0123456789", ReadFile(loc.key));
  EXPECT_EQ(0u, m_backend->GetPendingWriteCount());

  StatOutcome outcome = m_backend->Stat(loc);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(10u, outcome.GetResult().size);
  EXPECT_FALSE(outcome.GetResult().isDirectory);

  // a committed write id is gone
  ClientError err = m_backend->CommitWrite(loc, writeId);
  EXPECT_EQ(ErrorCode::PARAMETER_MISSING, err.GetError());
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, AbortLeavesNothing) {
  ObjectLocation loc = Local("aborted.txt");
  RemoveFileIfExists(loc.key);

  string writeId;
  ASSERT_TRUE(m_backend->BeginWrite(loc, 4, &writeId).IsGood());
  EXPECT_TRUE(m_backend->WriteChunk(loc, writeId, 0, "abcd", 4).IsGood());
  string partial = loc.key + "." + writeId + GetPartialFileSuffix();

  EXPECT_TRUE(m_backend->AbortWrite(loc, writeId).IsGood());
  EXPECT_FALSE(FileExists(partial));
  EXPECT_FALSE(FileExists(loc.key));
  EXPECT_EQ(0u, m_backend->GetPendingWriteCount());

  // unknown ids abort fine, but cannot be written
  EXPECT_TRUE(m_backend->AbortWrite(loc, writeId).IsGood());
  EXPECT_EQ(ErrorCode::PARAMETER_MISSING,
            m_backend->WriteChunk(loc, writeId, 0, "a", 1).GetError());
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, FailedCommitKeepsWrite) {
  // a non empty directory in the way makes the rename fail
  ObjectLocation loc = Local("blocked");
  RemoveFileIfExists(loc.key);
  string blocker = loc.key + "/inside.txt";
  CreateDirectoryIfNotExists(loc.key);
  WriteFile(blocker, "x");

  string writeId;
  ASSERT_TRUE(m_backend->BeginWrite(loc, 4, &writeId).IsGood());
  EXPECT_TRUE(m_backend->WriteChunk(loc, writeId, 0, "data", 4).IsGood());
  string partial = loc.key + "." + writeId + GetPartialFileSuffix();

  ClientError first = m_backend->CommitWrite(loc, writeId);
  EXPECT_FALSE(first.IsGood());
  EXPECT_NE(ErrorCode::PARAMETER_MISSING, first.GetError());
  EXPECT_EQ(1u, m_backend->GetPendingWriteCount());
  EXPECT_TRUE(FileExists(partial));

  // committing again reports the same cause
  ClientError second = m_backend->CommitWrite(loc, writeId);
  EXPECT_EQ(first.GetError(), second.GetError());
  EXPECT_EQ(first.GetMessage(), second.GetMessage());

  // and succeeds once the way is clear
  RemoveFileIfExists(blocker);
  ASSERT_EQ(0, ::rmdir(loc.key.c_str()));
  ASSERT_TRUE(m_backend->CommitWrite(loc, writeId).IsGood());
  EXPECT_EQ("data", ReadFile(loc.key));
  EXPECT_FALSE(FileExists(partial));
  EXPECT_EQ(0u, m_backend->GetPendingWriteCount());
  RemoveFileIfExists(loc.key);
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, AbortAfterFailedCommit) {
  ObjectLocation loc = Local("blocked.abort");
  RemoveFileIfExists(loc.key);
  string blocker = loc.key + "/inside.txt";
  CreateDirectoryIfNotExists(loc.key);
  WriteFile(blocker, "x");

  string writeId;
  ASSERT_TRUE(m_backend->BeginWrite(loc, 4, &writeId).IsGood());
  EXPECT_TRUE(m_backend->WriteChunk(loc, writeId, 0, "data", 4).IsGood());
  string partial = loc.key + "." + writeId + GetPartialFileSuffix();
  EXPECT_FALSE(m_backend->CommitWrite(loc, writeId).IsGood());

  EXPECT_TRUE(m_backend->AbortWrite(loc, writeId).IsGood());
  EXPECT_FALSE(FileExists(partial));
  EXPECT_EQ(0u, m_backend->GetPendingWriteCount());
  EXPECT_EQ("x", ReadFile(blocker));
  RemoveFileIfExists(blocker);
  ::rmdir(loc.key.c_str());
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, ExistingFileSurvivesAbort) {
  ObjectLocation loc = Local("kept.txt");
  WriteFile(loc.key, "original");

  string writeId;
  ASSERT_TRUE(m_backend->BeginWrite(loc, 3, &writeId).IsGood());
  EXPECT_TRUE(m_backend->WriteChunk(loc, writeId, 0, "new", 3).IsGood());
  EXPECT_TRUE(m_backend->AbortWrite(loc, writeId).IsGood());
  EXPECT_EQ("original", ReadFile(loc.key));
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, ReadChunk) {
  ObjectLocation loc = Local("read.txt");
  WriteFile(loc.key, "hello world");

  vector<char> data;
  ASSERT_TRUE(m_backend->ReadChunk(loc, 6, 5, &data).IsGood());
  EXPECT_EQ("world", string(data.begin(), data.end()));

  // reading past the end returns what is there
  ASSERT_TRUE(m_backend->ReadChunk(loc, 8, 10, &data).IsGood());
  EXPECT_EQ("rld", string(data.begin(), data.end()));

  EXPECT_EQ(ErrorCode::PARAMETER_MISSING,
            m_backend->ReadChunk(loc, 0, 1, NULL).GetError());
  EXPECT_EQ(ErrorCode::NOT_FOUND,
            m_backend->ReadChunk(Local("absent.txt"), 0, 1, &data).GetError());
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, StatAndDelete) {
  StatOutcome missing = m_backend->Stat(Local("absent.txt"));
  EXPECT_FALSE(missing.IsSuccess());
  EXPECT_EQ(ErrorCode::NOT_FOUND, missing.GetError().GetError());
  EXPECT_FALSE(missing.GetError().ShouldRetry());

  StatOutcome dir = m_backend->Stat(ObjectLocation("", localDir));
  ASSERT_TRUE(dir.IsSuccess());
  EXPECT_TRUE(dir.GetResult().isDirectory);

  ObjectLocation loc = Local("delete.txt");
  WriteFile(loc.key, "x");
  EXPECT_TRUE(m_backend->DeleteObject(loc).IsGood());
  EXPECT_FALSE(FileExists(loc.key));
  // deleting a missing file succeeds
  EXPECT_TRUE(m_backend->DeleteObject(loc).IsGood());

  EXPECT_EQ(ErrorCode::MALFORMED_REQUEST,
            m_backend->Stat(ObjectLocation("", "")).GetError().GetError());
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, NoMultipartOrPresign) {
  EXPECT_FALSE(m_backend->SupportsMultipart());
  string uploadId;
  EXPECT_EQ(ErrorCode::NOT_SUPPORTED,
            m_backend->InitiateMultipartUpload(Local("a"), &uploadId)
                .GetError());
  string url;
  EXPECT_EQ(ErrorCode::NOT_SUPPORTED,
            m_backend
                ->PresignUrl(Local("a"), PresignOperation::GetObject, 60,
                             QueryParams(), &url)
                .GetError());
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, SmbStaysUnderMountRoot) {
  BackendFactory factory;
  shared_ptr<Backend> smb =
      factory.MakeBackend(MakeConfig(ProviderFamily::SMB, "smb", smbRoot));
  EXPECT_EQ(ProviderFamily::SMB, smb->GetFamily());

  ObjectLocation loc("share", "dir/file.txt");
  string writeId;
  ASSERT_TRUE(smb->BeginWrite(loc, 3, &writeId).IsGood());
  EXPECT_TRUE(smb->WriteChunk(loc, writeId, 0, "smb", 3).IsGood());
  ASSERT_TRUE(smb->CommitWrite(loc, writeId).IsGood());
  EXPECT_EQ("smb", ReadFile(string(smbRoot) + "/share/dir/file.txt"));

  ObjectLocation escape("share", "../../etc/passwd");
  EXPECT_EQ(ErrorCode::MALFORMED_REQUEST,
            smb->Stat(escape).GetError().GetError());
  EXPECT_EQ(ErrorCode::MALFORMED_REQUEST,
            smb->Stat(ObjectLocation("..", "x")).GetError().GetError());
  EXPECT_EQ(ErrorCode::MALFORMED_REQUEST,
            smb->Stat(ObjectLocation("", "x")).GetError().GetError());

  EXPECT_TRUE(smb->DeleteObject(loc).IsGood());
}

// --------------------------------------------------------------------------
TEST_F(LocalBackendTest, SmbRequiresMountRoot) {
  EXPECT_THROW(SMBBackend(MakeConfig(ProviderFamily::SMB, "smb", "")),
               ProviderConfigError);
  EXPECT_THROW(
      SMBBackend(MakeConfig(ProviderFamily::SMB, "smb", "/nonexistent/root")),
      ProviderConfigError);
}

}  // namespace Client
}  // namespace FIO

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
