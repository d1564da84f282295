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

#include "client/Presigner.h"

#include <ctype.h>
#include <time.h>

#include <map>
#include <string>
#include <utility>

#include "openssl/evp.h"
#include "openssl/hmac.h"
#include "openssl/sha.h"

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "base/StringUtils.h"
#include "base/TimeUtils.h"
#include "configure/Default.h"

namespace FIO {

namespace Client {

using boost::to_string;
using FIO::Configure::Default::GetMaxPresignExpires;
using FIO::Exception::ValidationError;
using FIO::StringUtils::HexEncode;
using FIO::StringUtils::UriEncode;
using FIO::TimeUtils::SecondsToDateStamp;
using FIO::TimeUtils::SecondsToISO8601Basic;
using std::map;
using std::string;

namespace {

const char *const kAlgorithm = "AWS4-HMAC-SHA256";
const char *const kService = "s3";
const char *const kTerminator = "aws4_request";
const char *const kUnsignedPayload = "UNSIGNED-PAYLOAD";

}  // namespace

// --------------------------------------------------------------------------
string Sha256Hex(const string &data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(),
         hash);
  return HexEncode(hash, SHA256_DIGEST_LENGTH);
}

// --------------------------------------------------------------------------
string HmacSha256(const string &key, const string &data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char *>(data.data()), data.size(), hash,
       &len);
  return string(reinterpret_cast<const char *>(hash), len);
}

// --------------------------------------------------------------------------
Presigner::Presigner(const Credentials &credentials, const string &region,
                     const Http::Endpoint &endpoint, bool virtualHostedStyle)
    : m_credentials(credentials),
      m_region(region.empty() ? "us-east-1" : region),
      m_endpoint(endpoint),
      m_virtualHostedStyle(virtualHostedStyle) {}

// --------------------------------------------------------------------------
string Presigner::Presign(const ObjectLocation &loc,
                          PresignOperation::Value op, uint32_t expiresInSec,
                          const QueryParams &params) const {
  return Presign(loc, op, expiresInSec, params, time(NULL));
}

// --------------------------------------------------------------------------
string Presigner::Presign(const ObjectLocation &loc,
                          PresignOperation::Value op, uint32_t expiresInSec,
                          const QueryParams &params, time_t now) const {
  if (expiresInSec < 1 || expiresInSec > GetMaxPresignExpires()) {
    throw ValidationError("presign expiry " + to_string(expiresInSec) +
                          " is out of range [1, " +
                          to_string(GetMaxPresignExpires()) + "]");
  }

  string amzDate = SecondsToISO8601Basic(now);
  string dateStamp = SecondsToDateStamp(now);
  string scope =
      dateStamp + "/" + m_region + "/" + kService + "/" + kTerminator;
  string host = BuildHost(loc.container);
  string canonicalUri = BuildCanonicalUri(loc);

  // sorted by encoded name
  map<string, string> query;
  for (QueryParams::const_iterator it = params.begin(); it != params.end();
       ++it) {
    query[UriEncode(it->first, false)] = UriEncode(it->second, false);
  }
  query["X-Amz-Algorithm"] = kAlgorithm;
  query["X-Amz-Credential"] =
      UriEncode(m_credentials.GetAccessKeyId() + "/" + scope, false);
  query["X-Amz-Date"] = amzDate;
  query["X-Amz-Expires"] = to_string(expiresInSec);
  query["X-Amz-SignedHeaders"] = "host";
  if (!m_credentials.GetSessionToken().empty()) {
    query["X-Amz-Security-Token"] =
        UriEncode(m_credentials.GetSessionToken(), false);
  }

  string canonicalQuery;
  for (map<string, string>::const_iterator it = query.begin();
       it != query.end(); ++it) {
    if (!canonicalQuery.empty()) {
      canonicalQuery.append("&");
    }
    canonicalQuery.append(it->first + "=" + it->second);
  }

  string canonicalRequest = PresignOperationToMethod(op) + "\n" +
                            canonicalUri + "\n" + canonicalQuery + "\n" +
                            "host:" + host + "\n\n" + "host\n" +
                            kUnsignedPayload;

  string stringToSign = string(kAlgorithm) + "\n" + amzDate + "\n" + scope +
                        "\n" + Sha256Hex(canonicalRequest);

  string signingKey =
      HmacSha256("AWS4" + m_credentials.GetSecretKey(), dateStamp);
  signingKey = HmacSha256(signingKey, m_region);
  signingKey = HmacSha256(signingKey, kService);
  signingKey = HmacSha256(signingKey, kTerminator);
  string raw = HmacSha256(signingKey, stringToSign);
  string signature =
      HexEncode(reinterpret_cast<const unsigned char *>(raw.data()),
                raw.size());

  return Http::ProtocolToString(m_endpoint.protocol) + "://" + host +
         canonicalUri + "?" + canonicalQuery + "&X-Amz-Signature=" + signature;
}

// --------------------------------------------------------------------------
string Presigner::BuildHost(const string &container) const {
  if (m_virtualHostedStyle && !container.empty()) {
    return container + "." + m_endpoint.HostHeader();
  }
  return m_endpoint.HostHeader();
}

// --------------------------------------------------------------------------
string Presigner::BuildCanonicalUri(const ObjectLocation &loc) const {
  string encodedKey = UriEncode(loc.key, true);
  if (m_virtualHostedStyle || loc.container.empty()) {
    return "/" + encodedKey;
  }
  return "/" + loc.container + "/" + encodedKey;
}

// --------------------------------------------------------------------------
bool Presigner::IsDnsCompatibleBucketName(const string &bucket) {
  if (bucket.size() < 3 || bucket.size() > 63) {
    return false;
  }
  for (string::const_iterator it = bucket.begin(); it != bucket.end(); ++it) {
    unsigned char c = static_cast<unsigned char>(*it);
    if (!(islower(c) || isdigit(c) || c == '-')) {
      return false;
    }
  }
  return bucket[0] != '-' && bucket[bucket.size() - 1] != '-';
}

}  // namespace Client
}  // namespace FIO
