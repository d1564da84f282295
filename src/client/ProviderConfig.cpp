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

#include "client/ProviderConfig.h"

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"

#include "base/StringUtils.h"

namespace FIO {

namespace Client {

using boost::to_string;
using FIO::StringUtils::Split;
using FIO::StringUtils::ToLower;
using FIO::StringUtils::ToUpper;
using FIO::StringUtils::Trim;
using std::string;
using std::vector;

namespace {

vector<ProviderDescriptor> BuildDescriptors() {
  vector<ProviderDescriptor> descs;
  // name, family, prefix, deprecated prefix, scheme, aliases,
  // endpoint, access key, secret key, token, region,
  // endpoint required, credentials required
  ProviderDescriptor local = {
      "LOCAL", ProviderFamily::Local, "", "", "file", "",
      "", "", "", "", "", false, false};
  ProviderDescriptor aws = {
      "AWS", ProviderFamily::S3Compatible, "AWS_", "", "s3", "aws",
      "S3_ENDPOINT", "ACCESS_KEY_ID", "SECRET_ACCESS_KEY", "ACCESS_TOKEN",
      "us-east-1", false, true};
  ProviderDescriptor minio = {
      "MINIO", ProviderFamily::S3Compatible, "MINIO_", "", "mc", "minio,mio",
      "ENDPOINT", "ACCESS_KEY", "SECRET_KEY", "ACCESS_TOKEN",
      "us-east-1", true, true};
  ProviderDescriptor s3c = {
      "S3C", ProviderFamily::S3Compatible, "S3C_", "S3_COMPAT_", "s3c",
      "s3compat", "ENDPOINT", "ACCESS_KEY", "SECRET_KEY", "ACCESS_TOKEN",
      "us-east-1", true, true};
  ProviderDescriptor r2 = {
      "R2", ProviderFamily::S3Compatible, "R2_", "", "r2", "",
      "ENDPOINT", "ACCESS_KEY_ID", "SECRET_ACCESS_KEY", "ACCESS_TOKEN",
      "auto", false, true};
  ProviderDescriptor smb = {
      "SMB", ProviderFamily::SMB, "SMB_", "", "smb", "",
      "ENDPOINT", "USERNAME", "PASSWORD", "", "", false, false};
  descs.push_back(local);
  descs.push_back(aws);
  descs.push_back(minio);
  descs.push_back(s3c);
  descs.push_back(r2);
  descs.push_back(smb);
  return descs;
}

}  // namespace

// --------------------------------------------------------------------------
string ProviderFamilyToString(ProviderFamily::Value family) {
  switch (family) {
    case ProviderFamily::Local:
      return "Local";
    case ProviderFamily::S3Compatible:
      return "S3Compatible";
    case ProviderFamily::SMB:
      return "SMB";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
string AddressingStyleToString(AddressingStyle::Value style) {
  switch (style) {
    case AddressingStyle::Path:
      return "path";
    case AddressingStyle::Virtual:
      return "virtual";
    default:
      return "auto";
  }
}

// --------------------------------------------------------------------------
AddressingStyle::Value StringToAddressingStyle(const string &name) {
  string str = ToLower(Trim(name, ' '));
  if (str == "path") {
    return AddressingStyle::Path;
  } else if (str == "virtual") {
    return AddressingStyle::Virtual;
  }
  return AddressingStyle::Auto;
}

// --------------------------------------------------------------------------
const vector<ProviderDescriptor> &GetProviderDescriptors() {
  static const vector<ProviderDescriptor> descs = BuildDescriptors();
  return descs;
}

// --------------------------------------------------------------------------
const ProviderDescriptor *FindProviderByName(const string &name) {
  string upper = ToUpper(Trim(name, ' '));
  BOOST_FOREACH(const ProviderDescriptor &desc, GetProviderDescriptors()) {
    if (upper == desc.name) {
      return &desc;
    }
  }
  return NULL;
}

// --------------------------------------------------------------------------
const ProviderDescriptor *FindProviderByScheme(const string &scheme) {
  BOOST_FOREACH(const ProviderDescriptor &desc, GetProviderDescriptors()) {
    if (scheme == desc.canonicalScheme) {
      return &desc;
    }
    string aliases = desc.schemeAliases;
    if (aliases.empty()) {
      continue;
    }
    BOOST_FOREACH(const string &alias, Split(aliases, ',')) {
      if (scheme == alias) {
        return &desc;
      }
    }
  }
  return NULL;
}

// --------------------------------------------------------------------------
const ProviderDescriptor *GetCanonicalProvider(ProviderFamily::Value family) {
  switch (family) {
    case ProviderFamily::Local:
      return FindProviderByName("LOCAL");
    case ProviderFamily::S3Compatible:
      return FindProviderByName("S3C");
    case ProviderFamily::SMB:
      return FindProviderByName("SMB");
    default:
      return NULL;
  }
}

// --------------------------------------------------------------------------
string ProviderConfig::ToString() const {
  string str = "[scheme=" + m_settings.scheme +
               " provider=" + m_settings.providerName +
               " family=" + ProviderFamilyToString(m_settings.family);
  if (!m_settings.envPrefix.empty()) {
    str.append(" prefix=" + m_settings.envPrefix);
  }
  if (!m_settings.endpointUrl.empty()) {
    str.append(" endpoint=" + m_settings.endpointUrl);
  }
  if (!m_settings.region.empty()) {
    str.append(" region=" + m_settings.region);
  }
  if (m_settings.anonymous) {
    str.append(" anonymous");
  } else if (!m_settings.credentials.GetAccessKeyId().empty()) {
    str.append(" accessKeyId=" +
               m_settings.credentials.GetMaskedAccessKeyId());
  }
  if (!m_settings.mountRoot.empty()) {
    str.append(" mountRoot=" + m_settings.mountRoot);
  }
  if (m_settings.maxRetries >= 0) {
    str.append(" maxRetries=" + to_string(m_settings.maxRetries));
  }
  if (m_settings.maxConcurrency > 0) {
    str.append(" maxConcurrency=" + to_string(m_settings.maxConcurrency));
  }
  str.append("]");
  return str;
}

}  // namespace Client
}  // namespace FIO
