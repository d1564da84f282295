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

#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Size.h"
#include "configure/Environment.h"
#include "configure/PerformanceProfile.h"

namespace FIO {

namespace Configure {

using FIO::Exception::ValidationError;
using std::string;
using std::vector;
using ::testing::Test;

class PerformanceProfileTest : public Test {
 protected:
  PerformanceProfile m_profile;
};

TEST_F(PerformanceProfileTest, DefaultTiers) {
  const vector<PerformanceTier> &tiers = m_profile.GetTiers();
  ASSERT_EQ(4u, tiers.size());
  EXPECT_EQ("small", m_profile.TierFor(0).name);
  EXPECT_EQ("small", m_profile.TierFor(FIO::Size::MB1 - 1).name);
  EXPECT_EQ("medium", m_profile.TierFor(FIO::Size::MB1).name);
  EXPECT_EQ("medium", m_profile.TierFor(FIO::Size::MB10 - 1).name);
  EXPECT_EQ("large", m_profile.TierFor(FIO::Size::MB10).name);
  EXPECT_EQ("huge", m_profile.TierFor(FIO::Size::MB50).name);
  EXPECT_EQ("huge", m_profile.TierFor(FIO::Size::GB5).name);

  EXPECT_EQ(FIO::Size::KB8, m_profile.TierFor(100).chunkSize);
  EXPECT_EQ(FIO::Size::KB64, m_profile.TierFor(100).bufferSize);
  EXPECT_EQ(8u, m_profile.TierFor(FIO::Size::MB100).maxConcurrency);
  EXPECT_EQ("medium", m_profile.DefaultTier().name);
}

TEST_F(PerformanceProfileTest, Monotonicity) {
  uint64_t sizes[] = {0,
                      1,
                      FIO::Size::MB1 - 1,
                      FIO::Size::MB1,
                      FIO::Size::MB5,
                      FIO::Size::MB10 - 1,
                      FIO::Size::MB10,
                      FIO::Size::MB50 - 1,
                      FIO::Size::MB50,
                      FIO::Size::GB5};
  size_t count = sizeof(sizes) / sizeof(sizes[0]);
  for (size_t i = 1; i < count; ++i) {
    const PerformanceTier &prev = m_profile.TierFor(sizes[i - 1]);
    const PerformanceTier &tier = m_profile.TierFor(sizes[i]);
    EXPECT_LE(prev.chunkSize, tier.chunkSize) << sizes[i];
    EXPECT_LE(prev.bufferSize, tier.bufferSize) << sizes[i];
    EXPECT_LE(prev.maxConcurrency, tier.maxConcurrency) << sizes[i];
  }
}

TEST_F(PerformanceProfileTest, MultipartBoundary) {
  uint64_t threshold = m_profile.GetSettings().multipartThreshold;
  EXPECT_EQ(FIO::Size::MB50, threshold);
  EXPECT_FALSE(m_profile.ShouldUseMultipart(threshold - 1));
  EXPECT_TRUE(m_profile.ShouldUseMultipart(threshold));
  EXPECT_EQ(FIO::Size::MB8, m_profile.GetMultipartChunkSize());
}

TEST_F(PerformanceProfileTest, AutoOptimizeGate) {
  EXPECT_FALSE(m_profile.ShouldAutoOptimize(0));
  EXPECT_FALSE(m_profile.ShouldAutoOptimize(FIO::Size::MB5));
  EXPECT_TRUE(m_profile.ShouldAutoOptimize(FIO::Size::MB5 + 1));
}

TEST_F(PerformanceProfileTest, NonMonotonicTiersRejected) {
  PerformanceSettings settings;
  settings.tiers[2].chunkSize = FIO::Size::KB8;
  EXPECT_THROW(PerformanceProfile profile(settings), ValidationError);

  PerformanceSettings unordered;
  unordered.tiers[2].lowerBound = unordered.tiers[1].lowerBound;
  EXPECT_THROW(PerformanceProfile profile(unordered), ValidationError);

  PerformanceSettings smallBuffer;
  smallBuffer.tiers[0].bufferSize = 1;
  EXPECT_THROW(PerformanceProfile profile(smallBuffer), ValidationError);

  PerformanceSettings noTier;
  noTier.tiers.clear();
  EXPECT_THROW(PerformanceProfile profile(noTier), ValidationError);
}

TEST_F(PerformanceProfileTest, MultipartPartSizeLimit) {
  PerformanceSettings settings;
  settings.multipartChunkSize = FIO::Size::MB4;
  EXPECT_THROW(PerformanceProfile profile(settings), ValidationError);

  settings.multipartChunkSize = FIO::Size::MB5;
  EXPECT_NO_THROW(PerformanceProfile profile(settings));

  MapEnvironment env;
  env.Set("FILEIO_PERF_MULTIPART_CHUNK_SIZE", "1MB");
  EXPECT_THROW(PerformanceProfile::FromEnvironment(env), ValidationError);
}

TEST_F(PerformanceProfileTest, FromEnvironment) {
  MapEnvironment env;
  env.Set("FILEIO_PERF_SMALL_FILE_CHUNK_SIZE", "16KB");
  env.Set("FILEIO_PERF_SMALL_FILE_BUFFER_SIZE", "64K");
  env.Set("FILEIO_PERF_MULTIPART_THRESHOLD", "100MB");
  env.Set("FILEIO_PERF_MAX_CONCURRENT_CHUNKS", "16");
  env.Set("fileio_perf_max_retries", "5");
  env.Set("FILEIO_PERF_RETRY_DELAY", "0.25");
  env.Set("FILEIO_PERF_AUTO_OPTIMIZE_THRESHOLD", "2MB");

  PerformanceProfile profile = PerformanceProfile::FromEnvironment(env);
  EXPECT_EQ(FIO::Size::KB64 / 4, profile.TierFor(0).chunkSize);
  EXPECT_EQ(FIO::Size::MB100, profile.GetSettings().multipartThreshold);
  EXPECT_EQ(16u, profile.TierFor(FIO::Size::GB1).maxConcurrency);
  EXPECT_EQ(5, profile.GetSettings().maxRetries);
  EXPECT_EQ(250u, profile.GetSettings().retryDelayInMs);
  EXPECT_TRUE(profile.ShouldAutoOptimize(FIO::Size::MB4));
  // untouched values keep the defaults
  EXPECT_EQ(FIO::Size::MB8, profile.GetMultipartChunkSize());
  EXPECT_EQ(300u, profile.GetSettings().readTimeoutInSec);
}

TEST_F(PerformanceProfileTest, FromEnvironmentMalformed) {
  MapEnvironment env;
  env.Set("FILEIO_PERF_MEDIUM_FILE_CHUNK_SIZE", "lots");
  EXPECT_THROW(PerformanceProfile::FromEnvironment(env), ValidationError);

  MapEnvironment delay;
  delay.Set("FILEIO_PERF_RETRY_DELAY", "1s");
  EXPECT_THROW(PerformanceProfile::FromEnvironment(delay), ValidationError);

  // a threshold breaking the order of tiers
  MapEnvironment bounds;
  bounds.Set("FILEIO_PERF_MEDIUM_FILE_THRESHOLD", "512KB");
  EXPECT_THROW(PerformanceProfile::FromEnvironment(bounds), ValidationError);
}

}  // namespace Configure
}  // namespace FIO

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
