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
#include <vector>

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/thread.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/ProviderConfig.h"
#include "client/ProviderConfigResolver.h"
#include "configure/Environment.h"

namespace FIO {

namespace Client {

using boost::make_shared;
using boost::shared_ptr;
using FIO::Configure::MapEnvironment;
using FIO::Exception::DuplicateSchemeError;
using FIO::Exception::ProviderConfigError;
using FIO::Exception::UnknownSchemeError;
using std::string;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/fileio.test.logs/";
void InitLog() {
  FIO::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  FIO::Logging::Log::Instance().Initialize(defaultLogDir);
}

void ResolveInto(ProviderConfigResolver *resolver, const string &scheme,
                 shared_ptr<const ProviderConfig> *out) {
  *out = resolver->Resolve(scheme);
}

class ProviderConfigResolverTest : public Test {
 protected:
  static void SetUpTestCase() { InitLog(); }

  void SetUp() { m_env = make_shared<MapEnvironment>(); }

  shared_ptr<ProviderConfigResolver> MakeResolver() {
    return make_shared<ProviderConfigResolver>(m_env);
  }

  size_t GetSlotCount(const ProviderConfigResolver &resolver) const {
    return resolver.m_slots.size();
  }

  shared_ptr<MapEnvironment> m_env;
};

TEST_F(ProviderConfigResolverTest, MultiInstance) {
  m_env->Set("FILEIO_MINIO_ENV_PREFIXES", "MINIO_PROD_:mcp,MINIO_DEV_:mcd");
  m_env->Set("MINIO_PROD_ENDPOINT", "https://a");
  m_env->Set("MINIO_PROD_ACCESS_KEY", "prodkey");
  m_env->Set("MINIO_PROD_SECRET_KEY", "prodsecret");
  m_env->Set("MINIO_DEV_ENDPOINT", "https://b");
  m_env->Set("MINIO_DEV_ACCESS_KEY", "devkey");
  m_env->Set("MINIO_DEV_SECRET_KEY", "devsecret");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();

  shared_ptr<const ProviderConfig> prod = resolver->Resolve("mcp");
  shared_ptr<const ProviderConfig> dev = resolver->Resolve("mcd");
  EXPECT_EQ("https://a", prod->GetEndpointUrl());
  EXPECT_EQ("https://b", dev->GetEndpointUrl());
  EXPECT_EQ("prodkey", prod->GetCredentials().GetAccessKeyId());
  EXPECT_EQ("devkey", dev->GetCredentials().GetAccessKeyId());
  EXPECT_EQ("MINIO", prod->GetProviderName());
  EXPECT_EQ(ProviderFamily::S3Compatible, prod->GetFamily());
  EXPECT_EQ("MINIO_PROD_", prod->GetEnvPrefix());

  // idempotent, same cached instance
  EXPECT_EQ(prod.get(), resolver->Resolve("mcp").get());
}

TEST_F(ProviderConfigResolverTest, ConcurrentFirstResolution) {
  m_env->Set("MINIO_ENDPOINT", "localhost:9000");
  m_env->Set("MINIO_ACCESS_KEY", "key");
  m_env->Set("MINIO_SECRET_KEY", "secret");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();

  const size_t count = 8;
  vector<shared_ptr<const ProviderConfig> > results(count);
  boost::thread_group threads;
  for (size_t i = 0; i < count; ++i) {
    threads.create_thread(
        boost::bind(ResolveInto, resolver.get(), string("mc"), &results[i]));
  }
  threads.join_all();
  for (size_t i = 1; i < count; ++i) {
    EXPECT_EQ(results[0].get(), results[i].get());
  }
  // a port other than 443 gets plain http
  EXPECT_EQ("http://localhost:9000", results[0]->GetEndpointUrl());
  EXPECT_EQ(9000, results[0]->GetEndpoint().port);
}

TEST_F(ProviderConfigResolverTest, DefaultSchemesAndAliases) {
  m_env->Set("AWS_ACCESS_KEY_ID", "AKIDEXAMPLE");
  m_env->Set("AWS_SECRET_ACCESS_KEY", "secret");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();

  EXPECT_TRUE(resolver->IsKnownScheme("s3"));
  EXPECT_TRUE(resolver->IsKnownScheme("aws"));
  EXPECT_TRUE(resolver->IsKnownScheme("file"));
  EXPECT_TRUE(resolver->IsKnownScheme("smb"));
  EXPECT_FALSE(resolver->IsKnownScheme("S3"));

  shared_ptr<const ProviderConfig> s3 = resolver->Resolve("s3");
  EXPECT_EQ("https://s3.us-east-1.amazonaws.com", s3->GetEndpointUrl());
  EXPECT_EQ("us-east-1", s3->GetRegion());
  EXPECT_EQ("s3v4", s3->GetSignatureVersion());

  shared_ptr<const ProviderConfig> local = resolver->Resolve("file");
  EXPECT_EQ(ProviderFamily::Local, local->GetFamily());
}

TEST_F(ProviderConfigResolverTest, UnknownScheme) {
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();
  EXPECT_THROW(resolver->Resolve("gcs"), UnknownSchemeError);
  // a failed resolution caches nothing
  EXPECT_EQ(0u, GetSlotCount(*resolver));
}

TEST_F(ProviderConfigResolverTest, MissingEndpointOrCredentials) {
  m_env->Set("MINIO_ACCESS_KEY", "key");
  m_env->Set("MINIO_SECRET_KEY", "secret");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();
  EXPECT_THROW(resolver->Resolve("mc"), ProviderConfigError);

  // no credentials and not anonymous
  EXPECT_THROW(resolver->Resolve("s3"), ProviderConfigError);

  m_env->Set("AWS_ANONYMOUS", "true");
  EXPECT_TRUE(resolver->Resolve("s3")->IsAnonymous());
}

TEST_F(ProviderConfigResolverTest, RegisterBinding) {
  m_env->Set("ARCHIVE_ENDPOINT", "archive.example.com");
  m_env->Set("ARCHIVE_ACCESS_KEY", "key");
  m_env->Set("ARCHIVE_SECRET_KEY", "secret");
  m_env->Set("ARCHIVE_MAX_CONCURRENCY", "2");
  m_env->Set("ARCHIVE_ADDRESSING_STYLE", "virtual");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();

  resolver->RegisterBinding("ARCHIVE_", "arc", "minio");
  // same binding again is a no-op
  resolver->RegisterBinding("ARCHIVE_", "arc", "MINIO");
  EXPECT_THROW(resolver->RegisterBinding("OTHER_", "arc", "MINIO"),
               DuplicateSchemeError);
  EXPECT_THROW(resolver->RegisterBinding("X_", "mc", "MINIO"),
               DuplicateSchemeError);
  EXPECT_THROW(resolver->RegisterBinding("X_", "x", "NOPE"),
               ProviderConfigError);

  shared_ptr<const ProviderConfig> arc = resolver->Resolve("arc");
  EXPECT_EQ("https://archive.example.com", arc->GetEndpointUrl());
  EXPECT_EQ(2u, arc->GetMaxConcurrency());
  EXPECT_EQ(AddressingStyle::Virtual, arc->GetAddressingStyle());
  // secrets stay out of the description
  EXPECT_EQ(string::npos, arc->ToString().find("secret"));
}

TEST_F(ProviderConfigResolverTest, MalformedPrefixesVariable) {
  m_env->Set("FILEIO_MINIO_ENV_PREFIXES", "MINIO_PROD_");
  EXPECT_THROW(MakeResolver(), ProviderConfigError);

  m_env->Set("FILEIO_MINIO_ENV_PREFIXES", "A_:dup,B_:dup");
  EXPECT_THROW(MakeResolver(), DuplicateSchemeError);
}

TEST_F(ProviderConfigResolverTest, DeprecatedPrefix) {
  m_env->Set("S3_COMPAT_ENDPOINT", "https://compat.example.com");
  m_env->Set("S3C_ACCESS_KEY", "key");
  m_env->Set("S3C_SECRET_KEY", "secret");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();
  EXPECT_EQ("https://compat.example.com",
            resolver->Resolve("s3c")->GetEndpointUrl());
}

TEST_F(ProviderConfigResolverTest, SmbAndR2) {
  m_env->Set("SMB_MOUNT_ROOT", "/mnt/share");
  m_env->Set("R2_ACCOUNT_ID", "abc123");
  m_env->Set("R2_ACCESS_KEY_ID", "key");
  m_env->Set("R2_SECRET_ACCESS_KEY", "secret");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();

  shared_ptr<const ProviderConfig> smb = resolver->Resolve("smb");
  EXPECT_EQ(ProviderFamily::SMB, smb->GetFamily());
  EXPECT_EQ("/mnt/share", smb->GetMountRoot());

  shared_ptr<const ProviderConfig> r2 = resolver->Resolve("r2");
  EXPECT_EQ("https://abc123.r2.cloudflarestorage.com", r2->GetEndpointUrl());
  EXPECT_EQ("auto", r2->GetRegion());
}

TEST_F(ProviderConfigResolverTest, MaxRetriesOnlyWhenSet) {
  m_env->Set("FILEIO_MINIO_ENV_PREFIXES", "MINIO_NR_:mnr");
  m_env->Set("MINIO_ENDPOINT", "localhost:9000");
  m_env->Set("MINIO_ACCESS_KEY", "key");
  m_env->Set("MINIO_SECRET_KEY", "secret");
  m_env->Set("MINIO_NR_ENDPOINT", "localhost:9001");
  m_env->Set("MINIO_NR_ACCESS_KEY", "key");
  m_env->Set("MINIO_NR_SECRET_KEY", "secret");
  m_env->Set("MINIO_NR_MAX_RETRIES", "0");
  shared_ptr<ProviderConfigResolver> resolver = MakeResolver();

  shared_ptr<const ProviderConfig> plain = resolver->Resolve("mc");
  EXPECT_FALSE(plain->HasMaxRetries());

  shared_ptr<const ProviderConfig> noRetry = resolver->Resolve("mnr");
  EXPECT_TRUE(noRetry->HasMaxRetries());
  EXPECT_EQ(0, noRetry->GetMaxRetries());

  EXPECT_FALSE(resolver->Resolve("file")->HasMaxRetries());
}

}  // namespace Client
}  // namespace FIO

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
