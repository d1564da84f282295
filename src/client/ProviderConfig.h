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

#ifndef FILEIO_CLIENT_PROVIDERCONFIG_H_
#define FILEIO_CLIENT_PROVIDERCONFIG_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "client/Credentials.h"
#include "client/Protocol.h"

namespace FIO {

namespace Client {

struct ProviderFamily {
  enum Value { Local, S3Compatible, SMB };
};

std::string ProviderFamilyToString(ProviderFamily::Value family);

struct AddressingStyle {
  enum Value { Auto, Path, Virtual };
};

std::string AddressingStyleToString(AddressingStyle::Value style);
AddressingStyle::Value StringToAddressingStyle(const std::string &name);

//
// ProviderDescriptor
//
// Static description of a supported provider: which family serves it,
// which schemes it owns by default and which variables it reads. Variable
// names are appended to the binding's prefix, e.g. "MINIO_" + "ENDPOINT".
//
struct ProviderDescriptor {
  const char *name;  // e.g. "MINIO", also used in FILEIO_MINIO_ENV_PREFIXES
  ProviderFamily::Value family;
  const char *defaultPrefix;
  const char *deprecatedPrefix;  // read when default prefix var is unset
  const char *canonicalScheme;
  const char *schemeAliases;  // comma separated
  const char *endpointVar;
  const char *accessKeyVar;
  const char *secretKeyVar;
  const char *sessionTokenVar;
  const char *defaultRegion;
  bool endpointRequired;
  bool credentialsRequired;
};

const std::vector<ProviderDescriptor> &GetProviderDescriptors();

// @return : null if no provider has this name (case insensitive)
const ProviderDescriptor *FindProviderByName(const std::string &name);

// @return : null if no provider owns this scheme by default
const ProviderDescriptor *FindProviderByScheme(const std::string &scheme);

// Provider used for a binding registered by family only
const ProviderDescriptor *GetCanonicalProvider(ProviderFamily::Value family);

// Resolved values, filled by the resolver
struct ProviderSettings {
  ProviderSettings()
      : family(ProviderFamily::Local),
        anonymous(false),
        addressingStyle(AddressingStyle::Auto),
        timeoutInSec(0),
        maxRetries(-1),
        maxConcurrency(0) {}

  std::string scheme;
  std::string providerName;
  ProviderFamily::Value family;
  std::string envPrefix;
  std::string endpointUrl;  // normalized, empty for local
  Http::Endpoint endpoint;
  Credentials credentials;
  bool anonymous;
  std::string region;
  std::string signatureVersion;
  AddressingStyle::Value addressingStyle;
  uint32_t timeoutInSec;
  int32_t maxRetries;  // -1 to keep the retry policy of the engine
  size_t maxConcurrency;  // 0 for no per instance limit
  std::string mountRoot;  // SMB only
};

//
// ProviderConfig
//
// Immutable, fully populated configuration of one scheme. One instance
// per scheme, shared by every handle of that scheme.
//
class ProviderConfig {
 public:
  explicit ProviderConfig(const ProviderSettings &settings)
      : m_settings(settings) {}

 public:
  const std::string &GetScheme() const { return m_settings.scheme; }
  const std::string &GetProviderName() const {
    return m_settings.providerName;
  }
  ProviderFamily::Value GetFamily() const { return m_settings.family; }
  const std::string &GetEnvPrefix() const { return m_settings.envPrefix; }
  const std::string &GetEndpointUrl() const { return m_settings.endpointUrl; }
  const Http::Endpoint &GetEndpoint() const { return m_settings.endpoint; }
  const Credentials &GetCredentials() const { return m_settings.credentials; }
  bool IsAnonymous() const { return m_settings.anonymous; }
  const std::string &GetRegion() const { return m_settings.region; }
  const std::string &GetSignatureVersion() const {
    return m_settings.signatureVersion;
  }
  AddressingStyle::Value GetAddressingStyle() const {
    return m_settings.addressingStyle;
  }
  uint32_t GetTimeoutInSec() const { return m_settings.timeoutInSec; }
  bool HasMaxRetries() const { return m_settings.maxRetries >= 0; }
  int32_t GetMaxRetries() const { return m_settings.maxRetries; }
  size_t GetMaxConcurrency() const { return m_settings.maxConcurrency; }
  const std::string &GetMountRoot() const { return m_settings.mountRoot; }

  // Description without secrets
  std::string ToString() const;

 private:
  ProviderSettings m_settings;
};

}  // namespace Client
}  // namespace FIO

#endif  // FILEIO_CLIENT_PROVIDERCONFIG_H_
