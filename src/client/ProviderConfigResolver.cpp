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

#include "client/ProviderConfigResolver.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/thread/locks.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "configure/Environment.h"

namespace FIO {

namespace Client {

using boost::lock_guard;
using boost::make_shared;
using boost::mutex;
using boost::shared_ptr;
using FIO::Exception::DuplicateSchemeError;
using FIO::Exception::ProviderConfigError;
using FIO::Exception::UnknownSchemeError;
using FIO::StringUtils::ParseBool;
using FIO::StringUtils::ParseSize;
using FIO::StringUtils::Split;
using FIO::StringUtils::Trim;
using std::map;
using std::pair;
using std::string;
using std::vector;

namespace {

bool IsValidScheme(const string &scheme) {
  return !scheme.empty() &&
         scheme.find_first_of(":/ ") == string::npos;
}

template <typename T>
T ParseNumber(const string &scheme, const string &var, const string &value) {
  pair<bool, uint64_t> res = ParseSize(value);
  if (!res.first) {
    throw ProviderConfigError(scheme, "unable to parse " + var + "=" + value);
  }
  return static_cast<T>(res.second);
}

}  // namespace

// --------------------------------------------------------------------------
string SchemeBinding::ToString() const {
  return "[scheme=" + scheme + " prefix=" + prefix +
         " provider=" + providerName + "]";
}

// --------------------------------------------------------------------------
ProviderConfigResolver::ProviderConfigResolver(
    const shared_ptr<Configure::Environment> &env)
    : m_env(env) {
  if (!m_env) {
    m_env = Configure::GetProcessEnvironment();
  }
  RegisterDefaultBindings();
  LoadBindingsFromEnvironment();
}

// --------------------------------------------------------------------------
void ProviderConfigResolver::RegisterDefaultBindings() {
  BOOST_FOREACH(const ProviderDescriptor &desc, GetProviderDescriptors()) {
    vector<string> schemes(1, desc.canonicalScheme);
    string aliases = desc.schemeAliases;
    if (!aliases.empty()) {
      vector<string> tokens = Split(aliases, ',');
      schemes.insert(schemes.end(), tokens.begin(), tokens.end());
    }
    BOOST_FOREACH(const string &scheme, schemes) {
      SchemeBinding binding;
      binding.prefix = desc.defaultPrefix;
      binding.scheme = scheme;
      binding.providerName = desc.name;
      binding.family = desc.family;
      binding.isDefault = true;
      AddBinding(binding);
    }
  }
}

// --------------------------------------------------------------------------
void ProviderConfigResolver::RegisterBinding(const string &prefix,
                                             const string &scheme,
                                             const string &providerName) {
  if (!IsValidScheme(scheme)) {
    throw ProviderConfigError(scheme, "invalid scheme name");
  }
  const ProviderDescriptor *desc = FindProviderByName(providerName);
  if (desc == NULL) {
    throw ProviderConfigError(scheme, "unknown provider " + providerName);
  }
  if (prefix.empty() && desc->family != ProviderFamily::Local) {
    throw ProviderConfigError(scheme, "empty environment prefix");
  }

  SchemeBinding binding;
  binding.prefix = prefix;
  binding.scheme = scheme;
  binding.providerName = desc->name;
  binding.family = desc->family;
  binding.isDefault = false;
  AddBinding(binding);
}

// --------------------------------------------------------------------------
void ProviderConfigResolver::RegisterBinding(const string &prefix,
                                             const string &scheme,
                                             ProviderFamily::Value family) {
  const ProviderDescriptor *desc = GetCanonicalProvider(family);
  if (desc == NULL) {
    throw ProviderConfigError(scheme, "unsupported provider family");
  }
  RegisterBinding(prefix, scheme, desc->name);
}

// --------------------------------------------------------------------------
void ProviderConfigResolver::AddBinding(const SchemeBinding &binding) {
  lock_guard<mutex> lock(m_bindingsLock);
  map<string, SchemeBinding>::iterator it = m_bindings.find(binding.scheme);
  if (it == m_bindings.end()) {
    m_bindings[binding.scheme] = binding;
    return;
  }
  const SchemeBinding &existing = it->second;
  if (existing.prefix == binding.prefix &&
      existing.providerName == binding.providerName) {
    return;
  }
  throw DuplicateSchemeError(binding.scheme, existing.ToString(),
                             binding.ToString());
}

// --------------------------------------------------------------------------
void ProviderConfigResolver::LoadBindingsFromEnvironment() {
  BOOST_FOREACH(const ProviderDescriptor &desc, GetProviderDescriptors()) {
    if (desc.family == ProviderFamily::Local) {
      continue;
    }
    string var = string(Configure::Default::GetEnvironmentPrefix()) +
                 desc.name + Configure::Default::GetEnvPrefixesSuffix();
    string value;
    if (!m_env->Get(var, &value)) {
      continue;
    }
    BOOST_FOREACH(const string &token, Split(value, ',')) {
      string entry = Trim(token, ' ');
      if (entry.empty()) {
        continue;
      }
      string::size_type sep = entry.find(':');
      if (sep == string::npos || sep == 0 || sep + 1 == entry.size()) {
        throw ProviderConfigError(
            entry, "malformed entry in " + var + ", expect PREFIX:scheme");
      }
      string prefix = Trim(entry.substr(0, sep), ' ');
      string scheme = Trim(entry.substr(sep + 1), ' ');
      RegisterBinding(prefix, scheme, desc.name);
      DebugInfo("Registered binding " << prefix << ":" << scheme << " from "
                                      << var);
    }
  }
}

// --------------------------------------------------------------------------
bool ProviderConfigResolver::IsKnownScheme(const string &scheme) const {
  lock_guard<mutex> lock(m_bindingsLock);
  return m_bindings.find(scheme) != m_bindings.end();
}

// --------------------------------------------------------------------------
vector<SchemeBinding> ProviderConfigResolver::GetBindings() const {
  lock_guard<mutex> lock(m_bindingsLock);
  vector<SchemeBinding> bindings;
  for (map<string, SchemeBinding>::const_iterator it = m_bindings.begin();
       it != m_bindings.end(); ++it) {
    bindings.push_back(it->second);
  }
  return bindings;
}

// --------------------------------------------------------------------------
SchemeBinding ProviderConfigResolver::FindBinding(const string &scheme) const {
  lock_guard<mutex> lock(m_bindingsLock);
  map<string, SchemeBinding>::const_iterator it = m_bindings.find(scheme);
  if (it == m_bindings.end()) {
    throw UnknownSchemeError(scheme);
  }
  return it->second;
}

// --------------------------------------------------------------------------
shared_ptr<ProviderConfigResolver::ResolutionSlot>
ProviderConfigResolver::GetSlot(const string &scheme) {
  lock_guard<mutex> lock(m_slotsLock);
  shared_ptr<ResolutionSlot> &slot = m_slots[scheme];
  if (!slot) {
    slot = make_shared<ResolutionSlot>();
  }
  return slot;
}

// --------------------------------------------------------------------------
shared_ptr<const ProviderConfig> ProviderConfigResolver::Resolve(
    const string &scheme) {
  SchemeBinding binding = FindBinding(scheme);
  shared_ptr<ResolutionSlot> slot = GetSlot(scheme);

  lock_guard<mutex> lock(slot->lock);
  if (!slot->config) {
    slot->config = Build(binding);
    Info("Resolved provider config " << slot->config->ToString());
  }
  return slot->config;
}

// --------------------------------------------------------------------------
bool ProviderConfigResolver::ReadVar(const SchemeBinding &binding,
                                     const ProviderDescriptor &desc,
                                     const string &name, string *value) const {
  if (name.empty()) {
    return false;
  }
  if (m_env->Get(binding.prefix + name, value) && !value->empty()) {
    return true;
  }
  string deprecated = desc.deprecatedPrefix;
  if (binding.isDefault && !deprecated.empty() &&
      m_env->Get(deprecated + name, value) && !value->empty()) {
    Warning("Variable " << deprecated << name << " is deprecated, use "
                        << binding.prefix << name);
    return true;
  }
  value->clear();
  return false;
}

// --------------------------------------------------------------------------
shared_ptr<const ProviderConfig> ProviderConfigResolver::Build(
    const SchemeBinding &binding) const {
  const ProviderDescriptor *descPtr = FindProviderByName(binding.providerName);
  if (descPtr == NULL) {
    throw ProviderConfigError(binding.scheme,
                              "unknown provider " + binding.providerName);
  }
  const ProviderDescriptor &desc = *descPtr;
  const string &scheme = binding.scheme;
  const string &prefix = binding.prefix;

  ProviderSettings settings;
  settings.scheme = scheme;
  settings.providerName = desc.name;
  settings.family = desc.family;
  settings.envPrefix = prefix;
  settings.timeoutInSec = Configure::Default::GetDefaultReadTimeoutInSec();
  if (desc.family == ProviderFamily::Local) {
    return make_shared<ProviderConfig>(settings);
  }

  string value;
  if (ReadVar(binding, desc, "ANONYMOUS", &value)) {
    pair<bool, bool> res = ParseBool(value);
    if (!res.first) {
      throw ProviderConfigError(
          scheme, "unable to parse " + prefix + "ANONYMOUS=" + value);
    }
    settings.anonymous = res.second;
  }
  if (ReadVar(binding, desc, "TIMEOUT", &value)) {
    settings.timeoutInSec =
        ParseNumber<uint32_t>(scheme, prefix + "TIMEOUT", value);
  }
  if (ReadVar(binding, desc, "MAX_RETRIES", &value)) {
    settings.maxRetries =
        ParseNumber<uint16_t>(scheme, prefix + "MAX_RETRIES", value);
  }
  if (ReadVar(binding, desc, "MAX_CONCURRENCY", &value)) {
    settings.maxConcurrency =
        ParseNumber<size_t>(scheme, prefix + "MAX_CONCURRENCY", value);
  }

  settings.region = desc.defaultRegion;
  if (ReadVar(binding, desc, "REGION", &value)) {
    settings.region = value;
  }

  // credentials
  string accessKey;
  string secretKey;
  string token;
  ReadVar(binding, desc, desc.accessKeyVar, &accessKey);
  ReadVar(binding, desc, desc.secretKeyVar, &secretKey);
  ReadVar(binding, desc, desc.sessionTokenVar, &token);
  settings.credentials = Credentials(accessKey, secretKey, token);
  if (desc.credentialsRequired && !settings.anonymous &&
      settings.credentials.IsEmpty()) {
    throw ProviderConfigError(
        scheme, "missing credentials " + prefix + desc.accessKeyVar + "/" +
                    prefix + desc.secretKeyVar + ", set " + prefix +
                    "ANONYMOUS=true for anonymous access");
  }

  // endpoint
  string endpoint;
  ReadVar(binding, desc, desc.endpointVar, &endpoint);
  if (desc.family == ProviderFamily::SMB) {
    settings.endpointUrl = endpoint;
    if (!ReadVar(binding, desc, "MOUNT_ROOT", &settings.mountRoot)) {
      throw ProviderConfigError(scheme, "missing " + prefix + "MOUNT_ROOT");
    }
    return make_shared<ProviderConfig>(settings);
  }

  if (endpoint.empty()) {
    string providerName = desc.name;
    if (providerName == "AWS") {
      endpoint = "https://s3." + settings.region + ".amazonaws.com";
    } else if (providerName == "R2" &&
               ReadVar(binding, desc, "ACCOUNT_ID", &value)) {
      endpoint = "https://" + value + ".r2.cloudflarestorage.com";
    }
  }
  if (endpoint.empty()) {
    throw ProviderConfigError(scheme,
                              "missing endpoint " + prefix + desc.endpointVar);
  }
  bool forceHttp = false;
  if (ReadVar(binding, desc, "SECURE", &value)) {
    pair<bool, bool> res = ParseBool(value);
    if (!res.first) {
      throw ProviderConfigError(
          scheme, "unable to parse " + prefix + "SECURE=" + value);
    }
    forceHttp = !res.second;
  }
  settings.endpointUrl = Http::NormalizeEndpoint(endpoint, forceHttp);
  if (!Http::ParseEndpoint(settings.endpointUrl, &settings.endpoint)) {
    throw ProviderConfigError(scheme,
                              "invalid endpoint " + settings.endpointUrl);
  }

  settings.signatureVersion = "s3v4";
  if (ReadVar(binding, desc, "SIGNATURE_VER", &value)) {
    settings.signatureVersion = value;
  }
  if (ReadVar(binding, desc, "ADDRESSING_STYLE", &value)) {
    settings.addressingStyle = StringToAddressingStyle(value);
  }
  return make_shared<ProviderConfig>(settings);
}

}  // namespace Client
}  // namespace FIO
