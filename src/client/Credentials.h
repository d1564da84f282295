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

#ifndef FILEIO_CLIENT_CREDENTIALS_H_
#define FILEIO_CLIENT_CREDENTIALS_H_

#include <string>

namespace FIO {

namespace Client {

class Credentials {
 public:
  Credentials() {}

  Credentials(const std::string &accessKeyId, const std::string &secretKey,
              const std::string &sessionToken = std::string())
      : m_accessKeyId(accessKeyId),
        m_secretKey(secretKey),
        m_sessionToken(sessionToken) {}

 public:
  const std::string &GetAccessKeyId() const { return m_accessKeyId; }
  const std::string &GetSecretKey() const { return m_secretKey; }
  const std::string &GetSessionToken() const { return m_sessionToken; }

  bool IsEmpty() const { return m_accessKeyId.empty() || m_secretKey.empty(); }

  // Access key id with all but the last 4 characters hidden, for logging
  std::string GetMaskedAccessKeyId() const {
    if (m_accessKeyId.size() <= 4) {
      return std::string(m_accessKeyId.size(), '*');
    }
    return std::string(m_accessKeyId.size() - 4, '*') +
           m_accessKeyId.substr(m_accessKeyId.size() - 4);
  }

 private:
  std::string m_accessKeyId;
  std::string m_secretKey;
  std::string m_sessionToken;
};

}  // namespace Client
}  // namespace FIO

#endif  // FILEIO_CLIENT_CREDENTIALS_H_
