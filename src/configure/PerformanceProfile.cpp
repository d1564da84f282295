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

#include "configure/PerformanceProfile.h"

#include <errno.h>
#include <stdlib.h>  // for strtod

#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"

#include "base/Exception.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "configure/Environment.h"

namespace FIO {

namespace Configure {

using boost::to_string;
using FIO::Exception::ValidationError;
using std::pair;
using std::string;
using std::vector;

namespace {

// Look up prefix + name, the settings loader is case insensitive
bool LookUp(const Environment &env, const string &name, string *value) {
  string key = string(Default::GetPerformanceEnvironmentPrefix()) + name;
  return env.Get(key, value) ||
         env.Get(FIO::StringUtils::ToLower(key), value);
}

template <typename T>
void OverrideSize(const Environment &env, const string &name, T *target) {
  string value;
  if (!LookUp(env, name, &value)) {
    return;
  }
  pair<bool, uint64_t> res = FIO::StringUtils::ParseSize(value);
  if (!res.first) {
    throw ValidationError("unable to parse " +
                          string(Default::GetPerformanceEnvironmentPrefix()) +
                          name + "=" + value);
  }
  *target = static_cast<T>(res.second);
}

// Seconds may be fractional, result in milliseconds
void OverrideSeconds(const Environment &env, const string &name,
                     uint32_t *targetInMs) {
  string value;
  if (!LookUp(env, name, &value)) {
    return;
  }
  string trimmed = FIO::StringUtils::Trim(value, ' ');
  char *end = NULL;
  errno = 0;
  double seconds = strtod(trimmed.c_str(), &end);
  if (trimmed.empty() || errno != 0 || end == NULL || *end != '\0' ||
      seconds < 0) {
    throw ValidationError("unable to parse " +
                          string(Default::GetPerformanceEnvironmentPrefix()) +
                          name + "=" + value);
  }
  *targetInMs = static_cast<uint32_t>(seconds * 1000 + 0.5);
}

}  // namespace

// --------------------------------------------------------------------------
string PerformanceTier::ToString() const {
  return "[tier=" + name + " lower=" + to_string(lowerBound) +
         " chunk=" + to_string(chunkSize) + " buffer=" + to_string(bufferSize) +
         " concurrency=" + to_string(maxConcurrency) + "]";
}

// --------------------------------------------------------------------------
PerformanceSettings::PerformanceSettings()
    : multipartThreshold(Default::GetDefaultMultipartThreshold()),
      multipartChunkSize(Default::GetDefaultMultipartChunkSize()),
      multipartMinPartSize(Default::GetMultipartMinPartSize()),
      autoOptimizeThreshold(Default::GetDefaultAutoOptimizeThreshold()),
      maxMemoryBuffer(Default::GetDefaultMaxMemoryBuffer()),
      maxConcurrentTransfers(Default::GetDefaultMaxConcurrentTransfers()),
      maxRetries(Default::GetDefaultMaxRetries()),
      retryDelayInMs(Default::GetDefaultRetryDelayInMs()),
      connectionTimeoutInSec(Default::GetDefaultConnectionTimeoutInSec()),
      readTimeoutInSec(Default::GetDefaultReadTimeoutInSec()) {
  tiers.push_back(PerformanceTier("small", 0, Default::GetSmallFileChunkSize(),
                                  Default::GetSmallFileBufferSize(),
                                  Default::GetSmallFileConcurrency()));
  tiers.push_back(PerformanceTier(
      "medium", Default::GetSmallFileThreshold(),
      Default::GetMediumFileChunkSize(), Default::GetMediumFileBufferSize(),
      Default::GetMediumFileConcurrency()));
  tiers.push_back(PerformanceTier(
      "large", Default::GetMediumFileThreshold(),
      Default::GetLargeFileChunkSize(), Default::GetLargeFileBufferSize(),
      Default::GetLargeFileConcurrency()));
  tiers.push_back(PerformanceTier(
      "huge", Default::GetLargeFileThreshold(), Default::GetHugeFileChunkSize(),
      Default::GetHugeFileBufferSize(),
      Default::GetDefaultMaxConcurrentChunks()));
}

// --------------------------------------------------------------------------
PerformanceProfile::PerformanceProfile() { Validate(m_settings); }

// --------------------------------------------------------------------------
PerformanceProfile::PerformanceProfile(const PerformanceSettings &settings)
    : m_settings(settings) {
  Validate(m_settings);
}

// --------------------------------------------------------------------------
PerformanceProfile PerformanceProfile::FromEnvironment(const Environment &env) {
  PerformanceSettings settings;
  vector<PerformanceTier> &tiers = settings.tiers;

  static const char *tierNames[] = {"SMALL", "MEDIUM", "LARGE", "HUGE"};
  for (size_t i = 0; i < tiers.size() && i < 4; ++i) {
    string tierName = string(tierNames[i]) + "_FILE_";
    OverrideSize(env, tierName + "CHUNK_SIZE", &tiers[i].chunkSize);
    OverrideSize(env, tierName + "BUFFER_SIZE", &tiers[i].bufferSize);
    OverrideSize(env, tierName + "CONCURRENCY", &tiers[i].maxConcurrency);
    // lower bound of the next tier
    if (i + 1 < tiers.size()) {
      OverrideSize(env, tierName + "THRESHOLD", &tiers[i + 1].lowerBound);
    }
  }
  OverrideSize(env, "MAX_CONCURRENT_CHUNKS", &tiers.back().maxConcurrency);
  OverrideSize(env, "MAX_CONCURRENT_TRANSFERS",
               &settings.maxConcurrentTransfers);
  OverrideSize(env, "MULTIPART_THRESHOLD", &settings.multipartThreshold);
  OverrideSize(env, "MULTIPART_CHUNK_SIZE", &settings.multipartChunkSize);
  OverrideSize(env, "AUTO_OPTIMIZE_THRESHOLD",
               &settings.autoOptimizeThreshold);
  OverrideSize(env, "MAX_MEMORY_BUFFER", &settings.maxMemoryBuffer);
  OverrideSize(env, "MAX_RETRIES", &settings.maxRetries);
  OverrideSeconds(env, "RETRY_DELAY", &settings.retryDelayInMs);
  OverrideSize(env, "CONNECTION_TIMEOUT", &settings.connectionTimeoutInSec);
  OverrideSize(env, "READ_TIMEOUT", &settings.readTimeoutInSec);

  return PerformanceProfile(settings);
}

// --------------------------------------------------------------------------
const PerformanceTier &PerformanceProfile::TierFor(uint64_t size) const {
  const vector<PerformanceTier> &tiers = m_settings.tiers;
  size_t idx = 0;
  for (size_t i = 1; i < tiers.size(); ++i) {
    if (tiers[i].lowerBound <= size) {
      idx = i;
    } else {
      break;
    }
  }
  return tiers[idx];
}

// --------------------------------------------------------------------------
const PerformanceTier &PerformanceProfile::DefaultTier() const {
  const vector<PerformanceTier> &tiers = m_settings.tiers;
  return tiers.size() > 1 ? tiers[1] : tiers[0];
}

// --------------------------------------------------------------------------
string PerformanceProfile::ToString() const {
  string str;
  BOOST_FOREACH(const PerformanceTier &tier, m_settings.tiers) {
    str.append(tier.ToString());
  }
  str.append("[multipartThreshold=" + to_string(m_settings.multipartThreshold) +
             " multipartChunk=" + to_string(m_settings.multipartChunkSize) +
             " autoOptimize=" + to_string(m_settings.autoOptimizeThreshold) +
             "]");
  return str;
}

// --------------------------------------------------------------------------
void PerformanceProfile::Validate(const PerformanceSettings &settings) {
  const vector<PerformanceTier> &tiers = settings.tiers;
  if (tiers.empty()) {
    throw ValidationError("no performance tier defined");
  }
  if (tiers[0].lowerBound != 0) {
    throw ValidationError("first tier must start at size 0 " +
                          tiers[0].ToString());
  }
  for (size_t i = 0; i < tiers.size(); ++i) {
    const PerformanceTier &tier = tiers[i];
    if (tier.chunkSize == 0 || tier.maxConcurrency == 0) {
      throw ValidationError("chunk size and concurrency must be positive " +
                            tier.ToString());
    }
    if (tier.bufferSize < tier.chunkSize) {
      throw ValidationError("buffer size is less than chunk size " +
                            tier.ToString());
    }
    if (i == 0) {
      continue;
    }
    const PerformanceTier &prev = tiers[i - 1];
    if (tier.lowerBound <= prev.lowerBound) {
      throw ValidationError("tier bounds are not increasing " +
                            prev.ToString() + tier.ToString());
    }
    if (tier.chunkSize < prev.chunkSize || tier.bufferSize < prev.bufferSize ||
        tier.maxConcurrency < prev.maxConcurrency) {
      throw ValidationError("tiers are not monotonic " + prev.ToString() +
                            tier.ToString());
    }
  }
  if (settings.multipartThreshold == 0 || settings.multipartChunkSize == 0) {
    throw ValidationError(
        "multipart threshold and chunk size must be positive");
  }
  if (settings.multipartChunkSize < settings.multipartMinPartSize) {
    throw ValidationError("multipart chunk size " +
                          to_string(settings.multipartChunkSize) +
                          " is less than the minimum part size " +
                          to_string(settings.multipartMinPartSize));
  }
  if (settings.maxConcurrentTransfers == 0) {
    throw ValidationError("max concurrent transfers must be positive");
  }
}

}  // namespace Configure
}  // namespace FIO
