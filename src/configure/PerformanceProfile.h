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

#ifndef FILEIO_CONFIGURE_PERFORMANCEPROFILE_H_
#define FILEIO_CONFIGURE_PERFORMANCEPROFILE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace FIO {

namespace Configure {

class Environment;

struct PerformanceTier {
  PerformanceTier()
      : lowerBound(0), chunkSize(0), bufferSize(0), maxConcurrency(0) {}
  PerformanceTier(const std::string &tierName, uint64_t lower, size_t chunk,
                  size_t buffer, size_t concurrency)
      : name(tierName),
        lowerBound(lower),
        chunkSize(chunk),
        bufferSize(buffer),
        maxConcurrency(concurrency) {}

  std::string ToString() const;

  std::string name;
  uint64_t lowerBound;  // smallest object size in this tier
  size_t chunkSize;
  size_t bufferSize;
  size_t maxConcurrency;
};

struct PerformanceSettings {
  // Settings with built-in defaults
  PerformanceSettings();

  std::vector<PerformanceTier> tiers;  // ordered by lower bound
  uint64_t multipartThreshold;
  size_t multipartChunkSize;
  size_t multipartMinPartSize;  // smallest part the store accepts
  uint64_t autoOptimizeThreshold;
  uint64_t maxMemoryBuffer;
  size_t maxConcurrentTransfers;
  uint16_t maxRetries;
  uint32_t retryDelayInMs;
  uint32_t connectionTimeoutInSec;
  uint32_t readTimeoutInSec;
};

//
// PerformanceProfile
//
// Maps an object size to chunk size, buffer size and concurrency, and
// decides between streaming chunks and backend multipart.
// Immutable once constructed, the constructor throws ValidationError on
// malformed settings.
//
class PerformanceProfile {
 public:
  PerformanceProfile();
  explicit PerformanceProfile(const PerformanceSettings &settings);

  // Build profile from FILEIO_PERF_* variables over the defaults
  //
  // @param  : environment
  // @return : profile
  //
  // Throws ValidationError for unparsable values or a non-monotonic result.
  static PerformanceProfile FromEnvironment(const Environment &env);

 public:
  // Tier whose lower bound is the greatest bound <= size
  const PerformanceTier &TierFor(uint64_t size) const;

  // Tier used when the size is not known
  const PerformanceTier &DefaultTier() const;

  bool ShouldUseMultipart(uint64_t size) const {
    return size >= m_settings.multipartThreshold;
  }

  size_t GetMultipartChunkSize() const {
    return m_settings.multipartChunkSize;
  }

  // Whether size is large enough for chunked transfer at all. Objects at
  // or below the gate go as one chunk.
  bool ShouldAutoOptimize(uint64_t size) const {
    return size > m_settings.autoOptimizeThreshold;
  }

  const PerformanceSettings &GetSettings() const { return m_settings; }
  const std::vector<PerformanceTier> &GetTiers() const {
    return m_settings.tiers;
  }

  std::string ToString() const;

 private:
  static void Validate(const PerformanceSettings &settings);

  PerformanceSettings m_settings;
};

}  // namespace Configure
}  // namespace FIO

#endif  // FILEIO_CONFIGURE_PERFORMANCEPROFILE_H_
