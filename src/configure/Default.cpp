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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "base/Size.h"
#include "base/StringUtils.h"

namespace FIO {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "fileio";
static const char* const FILEIO_DEFAULT_LOG_DIR = "/tmp/fileio_log/";
static const char* const FILEIO_ENV_PREFIX = "FILEIO_";
static const char* const FILEIO_PERF_ENV_PREFIX = "FILEIO_PERF_";
static const char* const FILEIO_ENV_PREFIXES_SUFFIX = "_ENV_PREFIXES";
static const char* const FILEIO_PARTIAL_FILE_SUFFIX = ".fileio-part";
static const char* const SDK_LOG_DIR_BASE_NAME = "sdk.log";

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultLogDirectory() { return FILEIO_DEFAULT_LOG_DIR; }
int32_t GetMaxLogSizeInMB() { return 50; }

uint16_t GetDefaultPort(const string& protocolName) {
  static const uint16_t HTTP_DEFAULT_PORT = 80;
  static const uint16_t HTTPS_DEFAULT_PORT = 443;
  return FIO::StringUtils::ToLower(protocolName) == "http"
             ? HTTP_DEFAULT_PORT
             : HTTPS_DEFAULT_PORT;
}

mode_t GetDefineFileMode() { return (S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH); }
mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

const char* GetEnvironmentPrefix() { return FILEIO_ENV_PREFIX; }
const char* GetPerformanceEnvironmentPrefix() { return FILEIO_PERF_ENV_PREFIX; }
const char* GetEnvPrefixesSuffix() { return FILEIO_ENV_PREFIXES_SUFFIX; }

uint64_t GetSmallFileThreshold() { return FIO::Size::MB1; }
uint64_t GetMediumFileThreshold() { return FIO::Size::MB10; }
uint64_t GetLargeFileThreshold() { return FIO::Size::MB50; }

// small files optimize for latency, huge ones for throughput
size_t GetSmallFileChunkSize() { return FIO::Size::KB8; }
size_t GetSmallFileBufferSize() { return FIO::Size::KB64; }
size_t GetMediumFileChunkSize() { return FIO::Size::KB64; }
size_t GetMediumFileBufferSize() { return FIO::Size::KB256; }
size_t GetLargeFileChunkSize() { return FIO::Size::KB256; }
size_t GetLargeFileBufferSize() { return FIO::Size::MB1; }
size_t GetHugeFileChunkSize() { return FIO::Size::MB1; }
size_t GetHugeFileBufferSize() { return FIO::Size::MB4; }

size_t GetSmallFileConcurrency() { return 2; }
size_t GetMediumFileConcurrency() { return 2; }
size_t GetLargeFileConcurrency() { return 4; }
size_t GetDefaultMaxConcurrentChunks() { return 8; }
size_t GetDefaultMaxConcurrentTransfers() { return 4; }

uint64_t GetDefaultMultipartThreshold() { return FIO::Size::MB50; }
size_t GetDefaultMultipartChunkSize() { return FIO::Size::MB8; }
uint64_t GetDefaultAutoOptimizeThreshold() { return FIO::Size::MB5; }
uint64_t GetDefaultMaxMemoryBuffer() { return FIO::Size::MB100; }

uint16_t GetDefaultMaxRetries() { return 3; }
uint32_t GetDefaultRetryDelayInMs() { return 1000; }
double GetDefaultRetryBackoffFactor() { return 2.0; }
uint32_t GetDefaultRetryMaxDelayInMs() { return 60 * 1000; }

uint32_t GetDefaultConnectionTimeoutInSec() { return 30; }
uint32_t GetDefaultReadTimeoutInSec() { return 300; }

size_t GetMultipartMinPartSize() { return FIO::Size::MB5; }
uint16_t GetMultipartMaxPartCount() { return 10000; }

uint32_t GetMaxPresignExpires() { return 7 * 24 * 3600; }

const char* GetPartialFileSuffix() { return FILEIO_PARTIAL_FILE_SUFFIX; }

const char* GetSDKLogFolderBaseName() { return SDK_LOG_DIR_BASE_NAME; }

}  // namespace Default
}  // namespace Configure
}  // namespace FIO
