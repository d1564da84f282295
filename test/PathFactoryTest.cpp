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

#include <string>

#include "boost/make_shared.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/future.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Logging.h"
#include "base/ThreadPool.h"
#include "base/Utils.h"
#include "client/Backend.h"
#include "client/ProviderConfig.h"
#include "client/ProviderConfigResolver.h"
#include "configure/Environment.h"
#include "filesystem/PathFactory.h"
#include "filesystem/PathHandle.h"

#include "MemoryBackend.h"

namespace FIO {

namespace FileSystem {

using boost::make_shared;
using boost::shared_ptr;
using FIO::Client::MemoryBackend;
using FIO::Client::MemoryBackendFactory;
using FIO::Client::PresignOperation;
using FIO::Client::ProviderConfigResolver;
using FIO::Client::ProviderFamily;
using FIO::Client::QueryParams;
using FIO::Configure::MapEnvironment;
using FIO::Exception::InvalidPathError;
using FIO::Exception::NotSupportedError;
using FIO::Exception::ProviderConfigError;
using FIO::Exception::UnknownSchemeError;
using FIO::Exception::ValidationError;
using FIO::Threading::ThreadPool;
using std::string;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/fileio.test.logs/";
void InitLog() {
  FIO::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  FIO::Logging::Log::Instance().Initialize(defaultLogDir);
}

class PathFactoryTest : public Test {
 protected:
  static void SetUpTestCase() { InitLog(); }

  void SetUp() {
    m_env = make_shared<MapEnvironment>();
    m_env->Set("MINIO_ENDPOINT", "localhost:9000");
    m_env->Set("MINIO_ACCESS_KEY", "key");
    m_env->Set("MINIO_SECRET_KEY", "secret");
    m_backends = make_shared<MemoryBackendFactory>();
    m_factory.reset(new PathFactory(
        make_shared<ProviderConfigResolver>(m_env), m_backends));
  }

  shared_ptr<MapEnvironment> m_env;
  shared_ptr<MemoryBackendFactory> m_backends;
  boost::scoped_ptr<PathFactory> m_factory;
};

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, ParseLocal) {
  ParsedPath abs = PathFactory::ParsePath("/tmp/data/a.txt");
  EXPECT_TRUE(abs.isLocal);
  EXPECT_EQ("file", abs.scheme);
  EXPECT_EQ("", abs.container);
  EXPECT_EQ("/tmp/data/a.txt", abs.key);

  ParsedPath rel = PathFactory::ParsePath("data/a.txt");
  EXPECT_TRUE(rel.isLocal);
  EXPECT_EQ("data/a.txt", rel.key);

  ParsedPath uri = PathFactory::ParsePath("file:///tmp/a.txt");
  EXPECT_TRUE(uri.isLocal);
  EXPECT_EQ("file", uri.scheme);
  EXPECT_EQ("/tmp/a.txt", uri.key);

  // "://" after the first slash is part of a local name
  ParsedPath nested = PathFactory::ParsePath("logs/a://b");
  EXPECT_TRUE(nested.isLocal);
  EXPECT_EQ("file", nested.scheme);
  EXPECT_EQ("logs/a://b", nested.key);

  ParsedPath absNested = PathFactory::ParsePath("/srv/x://y");
  EXPECT_TRUE(absNested.isLocal);
  EXPECT_EQ("/srv/x://y", absNested.key);
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, ParseRemote) {
  ParsedPath parsed = PathFactory::ParsePath("s3://bucket/dir/key.txt");
  EXPECT_FALSE(parsed.isLocal);
  EXPECT_EQ("s3", parsed.scheme);
  EXPECT_EQ("bucket", parsed.container);
  EXPECT_EQ("dir/key.txt", parsed.key);

  ParsedPath custom = PathFactory::ParsePath("minio-prod://b/k");
  EXPECT_EQ("minio-prod", custom.scheme);
  EXPECT_EQ("b", custom.container);
  EXPECT_EQ("k", custom.key);
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, ParseMalformed) {
  EXPECT_THROW(PathFactory::ParsePath(""), InvalidPathError);
  EXPECT_THROW(PathFactory::ParsePath("s3://"), InvalidPathError);
  EXPECT_THROW(PathFactory::ParsePath("s3://bucket"), InvalidPathError);
  EXPECT_THROW(PathFactory::ParsePath("s3://bucket/"), InvalidPathError);
  EXPECT_THROW(PathFactory::ParsePath("s3:///key"), InvalidPathError);
  EXPECT_THROW(PathFactory::ParsePath("1s3://bucket/key"), InvalidPathError);
  EXPECT_THROW(PathFactory::ParsePath("file://"), InvalidPathError);
  EXPECT_THROW(PathFactory::ParsePath(string("a\0b", 3)), InvalidPathError);
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, OpenSharesConfigAndBackend) {
  PathHandle first = m_factory->Open("mc://bucket/a/b.bin");
  PathHandle second = m_factory->Open("mc://bucket/a/c.bin");

  EXPECT_EQ(ProviderFamily::S3Compatible, first.GetFamily());
  EXPECT_FALSE(first.IsLocal());
  EXPECT_EQ("bucket", first.GetContainer());
  EXPECT_EQ("a/b.bin", first.GetKey());
  EXPECT_EQ("mc://bucket/a/b.bin", first.ToString());
  EXPECT_EQ(first.GetConfig().get(), second.GetConfig().get());
  EXPECT_EQ(first.GetBackend().get(), second.GetBackend().get());
  EXPECT_EQ(m_backends->GetMade("mc").get(), first.GetBackend().get());

  EXPECT_TRUE(first == m_factory->Open("mc://bucket/a/b.bin"));
  EXPECT_TRUE(first != second);
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, OpenLocal) {
  PathHandle path = m_factory->Open("/tmp/fileio.test.data");
  EXPECT_TRUE(path.IsLocal());
  EXPECT_EQ("/tmp/fileio.test.data", path.ToString());
  EXPECT_TRUE(path == m_factory->Open("file:///tmp/fileio.test.data"));

  // local files have no presigned url
  EXPECT_THROW(path.Url(3600), NotSupportedError);
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, OpenErrors) {
  EXPECT_THROW(m_factory->Open("nosuch://bucket/key"), UnknownSchemeError);
  EXPECT_THROW(m_factory->Open("s3://bucket"), InvalidPathError);

  // bound, but without an endpoint
  m_env->Unset("MINIO_ENDPOINT");
  PathFactory bare(make_shared<ProviderConfigResolver>(m_env), m_backends);
  EXPECT_THROW(bare.Open("mc://bucket/key"), ProviderConfigError);
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, Coercer) {
  PathCoercer coerce = m_factory->GetCoercer();
  PathHandle path = coerce("mc://bucket/key");
  EXPECT_TRUE(path == m_factory->Open("mc://bucket/key"));
  EXPECT_TRUE(m_factory->CoercePath("/tmp/x") == coerce("/tmp/x"));
  EXPECT_THROW(coerce("nosuch://bucket/key"), UnknownSchemeError);
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, Url) {
  PathHandle path = m_factory->Open("mc://bucket/key");
  string url = path.Url(3600);
  EXPECT_EQ(0u, url.find("memory://bucket/key?"));
  EXPECT_NE(string::npos, url.find("expires=3600"));

  QueryParams params;
  params["response-content-type"] = "text/plain";
  string put = path.Url(60, PresignOperation::PutObject, params);
  EXPECT_NE(string::npos, put.find("response-content-type=text/plain"));

  EXPECT_THROW(path.Url(0), ValidationError);
  EXPECT_THROW(path.Url(604801), ValidationError);
  EXPECT_NO_THROW(path.Url(604800));

  ThreadPool pool(2);
  boost::unique_future<string> future = path.UrlAsync(
      pool, 120, PresignOperation::GetObject, QueryParams());
  EXPECT_NE(string::npos, future.get().find("expires=120"));
}

// --------------------------------------------------------------------------
TEST_F(PathFactoryTest, StatThroughHandle) {
  PathHandle path = m_factory->Open("mc://bucket/obj");
  EXPECT_FALSE(path.Exists());
  EXPECT_THROW(path.Stat(), FIO::Exception::TransferError);

  m_backends->GetMade("mc")->PutObject(path.GetLocation(), "12345");
  EXPECT_TRUE(path.Exists());
  EXPECT_EQ(5u, path.Size());
  EXPECT_TRUE(path.HasCachedStat());
  path.InvalidateStat();
  EXPECT_FALSE(path.HasCachedStat());
}

}  // namespace FileSystem
}  // namespace FIO

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
