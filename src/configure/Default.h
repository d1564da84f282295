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

#ifndef FILEIO_CONFIGURE_DEFAULT_H_
#define FILEIO_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>

namespace FIO {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultLogDirectory();
int32_t GetMaxLogSizeInMB();

uint16_t GetDefaultPort(const std::string& protocolName);

mode_t GetDefineFileMode();
mode_t GetDefineDirMode();

// Environment variable prefixes
const char* GetEnvironmentPrefix();             // "FILEIO_"
const char* GetPerformanceEnvironmentPrefix();  // "FILEIO_PERF_"
const char* GetEnvPrefixesSuffix();             // "_ENV_PREFIXES"

// Size tiers, lower bounds of medium, large and huge tier
uint64_t GetSmallFileThreshold();
uint64_t GetMediumFileThreshold();
uint64_t GetLargeFileThreshold();

size_t GetSmallFileChunkSize();
size_t GetSmallFileBufferSize();
size_t GetMediumFileChunkSize();
size_t GetMediumFileBufferSize();
size_t GetLargeFileChunkSize();
size_t GetLargeFileBufferSize();
size_t GetHugeFileChunkSize();
size_t GetHugeFileBufferSize();

size_t GetSmallFileConcurrency();
size_t GetMediumFileConcurrency();
size_t GetLargeFileConcurrency();
size_t GetDefaultMaxConcurrentChunks();  // concurrency of huge tier
size_t GetDefaultMaxConcurrentTransfers();

uint64_t GetDefaultMultipartThreshold();
size_t GetDefaultMultipartChunkSize();
uint64_t GetDefaultAutoOptimizeThreshold();
uint64_t GetDefaultMaxMemoryBuffer();

uint16_t GetDefaultMaxRetries();
uint32_t GetDefaultRetryDelayInMs();
double GetDefaultRetryBackoffFactor();
uint32_t GetDefaultRetryMaxDelayInMs();

uint32_t GetDefaultConnectionTimeoutInSec();
uint32_t GetDefaultReadTimeoutInSec();

// S3 multipart limits
size_t GetMultipartMinPartSize();
uint16_t GetMultipartMaxPartCount();

// Longest presigned url expiration, in seconds
uint32_t GetMaxPresignExpires();

// Suffix of the temp file a local write goes to before it is renamed
const char* GetPartialFileSuffix();

const char* GetSDKLogFolderBaseName();

}  // namespace Default
}  // namespace Configure
}  // namespace FIO


#endif  // FILEIO_CONFIGURE_DEFAULT_H_
