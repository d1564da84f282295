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

#ifndef FILEIO_CLIENT_PRESIGNER_H_
#define FILEIO_CLIENT_PRESIGNER_H_

#include <stdint.h>
#include <time.h>

#include <string>

#include "client/Backend.h"
#include "client/Credentials.h"
#include "client/Protocol.h"

namespace FIO {

namespace Client {

//
// Presigner
//
// AWS Signature Version 4 query string signing for S3 compatible stores.
// The signature is computed locally from the credentials, no request is
// made.
//
class Presigner {
 public:
  Presigner(const Credentials &credentials, const std::string &region,
            const Http::Endpoint &endpoint, bool virtualHostedStyle);

 public:
  // Build a presigned url
  //
  // @param  : location, operation, expiry in seconds, extra query params,
  //           signing time
  // @return : url
  //
  // Throws ValidationError if expiry is outside [1, 604800] seconds.
  std::string Presign(const ObjectLocation &loc, PresignOperation::Value op,
                      uint32_t expiresInSec, const QueryParams &params,
                      time_t now) const;

  // Same as above signed at current time
  std::string Presign(const ObjectLocation &loc, PresignOperation::Value op,
                      uint32_t expiresInSec, const QueryParams &params) const;

  std::string BuildHost(const std::string &container) const;
  std::string BuildCanonicalUri(const ObjectLocation &loc) const;

  // Whether the bucket name can be used as a dns label
  static bool IsDnsCompatibleBucketName(const std::string &bucket);

 private:
  Credentials m_credentials;
  std::string m_region;
  Http::Endpoint m_endpoint;
  bool m_virtualHostedStyle;
};

// Hex encoded sha256 of data
std::string Sha256Hex(const std::string &data);

// Raw hmac-sha256 of data
std::string HmacSha256(const std::string &key, const std::string &data);

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_PRESIGNER_H_
