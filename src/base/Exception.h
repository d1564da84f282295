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

#ifndef FILEIO_BASE_EXCEPTION_H_
#define FILEIO_BASE_EXCEPTION_H_

#include <stdint.h>

#include <stdexcept>
#include <string>

namespace FIO {

namespace Exception {

struct FIOException : public std::runtime_error {
 public:
  explicit FIOException(const std::string &err) : std::runtime_error(err) {}
  explicit FIOException(const char *err) : std::runtime_error(err) {}

  std::string get() const { return what(); }
};

// Scheme matches neither a supported default nor a registered binding.
class UnknownSchemeError : public FIOException {
 public:
  explicit UnknownSchemeError(const std::string &scheme);
  ~UnknownSchemeError() throw() {}

  const std::string &GetScheme() const { return m_scheme; }

 private:
  std::string m_scheme;
};

// Scheme is already bound to another prefix or provider.
class DuplicateSchemeError : public FIOException {
 public:
  DuplicateSchemeError(const std::string &scheme,
                       const std::string &existingBinding,
                       const std::string &requestedBinding);
  ~DuplicateSchemeError() throw() {}

  const std::string &GetScheme() const { return m_scheme; }

 private:
  std::string m_scheme;
};

// Missing or invalid endpoint/credentials for a scheme.
class ProviderConfigError : public FIOException {
 public:
  ProviderConfigError(const std::string &scheme, const std::string &reason);
  ~ProviderConfigError() throw() {}

  const std::string &GetScheme() const { return m_scheme; }

 private:
  std::string m_scheme;
};

class InvalidPathError : public FIOException {
 public:
  InvalidPathError(const std::string &path, const std::string &reason);
  ~InvalidPathError() throw() {}

  const std::string &GetPath() const { return m_path; }

 private:
  std::string m_path;
};

//
// TransferError
//
// Raised when a chunk (or a whole-object step) failed for good, either
// because the error is fatal or because the retries were used up.
//
class TransferError : public FIOException {
 public:
  // chunk index used for whole-object steps like stat or complete
  static const int64_t kNoChunk = -1;

  TransferError(const std::string &path, int64_t chunkIndex, uint16_t attempts,
                const std::string &cause, int errorCode = 0,
                bool retryable = false);
  ~TransferError() throw() {}

  const std::string &GetPath() const { return m_path; }
  int64_t GetChunkIndex() const { return m_chunkIndex; }
  uint16_t GetAttempts() const { return m_attempts; }
  const std::string &GetCause() const { return m_cause; }
  int GetErrorCode() const { return m_errorCode; }
  bool IsRetryable() const { return m_retryable; }

  // Message of a failed cleanup (abort or delete) following this error,
  // empty if the cleanup went through.
  const std::string &GetCleanupError() const { return m_cleanupError; }
  void SetCleanupError(const std::string &msg) { m_cleanupError = msg; }

 private:
  std::string m_path;
  int64_t m_chunkIndex;
  uint16_t m_attempts;
  std::string m_cause;
  int m_errorCode;
  bool m_retryable;
  std::string m_cleanupError;
};

class MultipartAbortError : public FIOException {
 public:
  MultipartAbortError(const std::string &path, const std::string &uploadId,
                      const std::string &cause);
  ~MultipartAbortError() throw() {}

  const std::string &GetPath() const { return m_path; }
  const std::string &GetUploadId() const { return m_uploadId; }

 private:
  std::string m_path;
  std::string m_uploadId;
};

class TimeoutError : public FIOException {
 public:
  TimeoutError(const std::string &path, uint32_t deadlineInMs);
  ~TimeoutError() throw() {}

  const std::string &GetPath() const { return m_path; }

 private:
  std::string m_path;
};

class CancelledError : public FIOException {
 public:
  explicit CancelledError(const std::string &path);
  ~CancelledError() throw() {}

  const std::string &GetPath() const { return m_path; }

 private:
  std::string m_path;
};

// Malformed performance or retry configuration
struct ValidationError : public FIOException {
  explicit ValidationError(const std::string &err)
      : FIOException("ValidationError: " + err) {}
};

struct NotSupportedError : public FIOException {
  explicit NotSupportedError(const std::string &err)
      : FIOException("NotSupportedError: " + err) {}
};

}  // namespace Exception
}  // namespace FIO


#endif  // FILEIO_BASE_EXCEPTION_H_
