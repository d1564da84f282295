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

#include "filesystem/PathFactory.h"

#include <ctype.h>

#include <string>

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/thread/locks.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "client/Backend.h"
#include "client/BackendFactory.h"
#include "client/ProviderConfig.h"
#include "client/ProviderConfigResolver.h"

namespace FIO {

namespace FileSystem {

using boost::lock_guard;
using boost::make_shared;
using boost::mutex;
using boost::shared_ptr;
using FIO::Client::Backend;
using FIO::Client::BackendFactory;
using FIO::Client::ProviderConfig;
using FIO::Client::ProviderConfigResolver;
using FIO::Exception::InvalidPathError;
using std::string;

namespace {

const char *const kSchemeDelim = "://";
const char *const kLocalScheme = "file";

bool IsValidScheme(const string &scheme) {
  if (scheme.empty() || !isalpha(static_cast<unsigned char>(scheme[0]))) {
    return false;
  }
  for (string::const_iterator it = scheme.begin(); it != scheme.end(); ++it) {
    unsigned char c = static_cast<unsigned char>(*it);
    if (!(isalnum(c) || c == '+' || c == '-' || c == '.' || c == '_')) {
      return false;
    }
  }
  return true;
}

}  // namespace

// --------------------------------------------------------------------------
PathFactory::PathFactory(const shared_ptr<ProviderConfigResolver> &resolver,
                         const shared_ptr<BackendFactory> &backendFactory)
    : m_resolver(resolver),
      m_backendFactory(backendFactory ? backendFactory
                                      : make_shared<BackendFactory>()) {
  if (!m_resolver) {
    throw FIO::Exception::FIOException("PathFactory requires a resolver");
  }
}

// --------------------------------------------------------------------------
PathFactory::PathFactory(const shared_ptr<ProviderConfigResolver> &resolver)
    : m_resolver(resolver), m_backendFactory(make_shared<BackendFactory>()) {
  if (!m_resolver) {
    throw FIO::Exception::FIOException("PathFactory requires a resolver");
  }
}

// --------------------------------------------------------------------------
ParsedPath PathFactory::ParsePath(const string &path) {
  if (path.empty()) {
    throw InvalidPathError(path, "empty path");
  }
  if (path.find('\0') != string::npos) {
    throw InvalidPathError(path, "path contains NUL character");
  }

  ParsedPath parsed;
  // a scheme ends before the first slash, later "://" belongs to a local path
  string::size_type pos = path.find(kSchemeDelim);
  if (pos == string::npos || path.find('/') < pos) {
    parsed.scheme = kLocalScheme;
    parsed.key = path;
    parsed.isLocal = true;
    return parsed;
  }

  parsed.scheme = path.substr(0, pos);
  if (!IsValidScheme(parsed.scheme)) {
    throw InvalidPathError(path, "invalid scheme '" + parsed.scheme + "'");
  }
  string rest = path.substr(pos + 3);

  if (parsed.scheme == kLocalScheme) {
    if (rest.empty()) {
      throw InvalidPathError(path, "missing file path");
    }
    parsed.key = rest;
    parsed.isLocal = true;
    return parsed;
  }

  string::size_type slash = rest.find('/');
  parsed.container = rest.substr(0, slash);
  if (parsed.container.empty()) {
    throw InvalidPathError(path, "missing container");
  }
  if (slash == string::npos || slash + 1 >= rest.size()) {
    throw InvalidPathError(path, "missing object key");
  }
  parsed.key = rest.substr(slash + 1);
  return parsed;
}

// --------------------------------------------------------------------------
PathHandle PathFactory::Open(const string &path) {
  ParsedPath parsed = ParsePath(path);
  shared_ptr<const ProviderConfig> config = m_resolver->Resolve(parsed.scheme);
  if (parsed.isLocal &&
      config->GetFamily() != FIO::Client::ProviderFamily::Local) {
    throw InvalidPathError(path, "scheme " + parsed.scheme +
                                     " is not bound to the local filesystem");
  }
  if (!parsed.isLocal &&
      config->GetFamily() == FIO::Client::ProviderFamily::Local) {
    // a local binding under another scheme, "<scheme>://dir/file"
    return PathHandle(parsed.scheme, "", parsed.container + "/" + parsed.key,
                      config, GetBackend(config));
  }
  return PathHandle(parsed.scheme, parsed.container, parsed.key, config,
                    GetBackend(config));
}

// --------------------------------------------------------------------------
PathCoercer PathFactory::GetCoercer() {
  return boost::bind(&PathFactory::Open, this, _1);
}

// --------------------------------------------------------------------------
shared_ptr<Backend> PathFactory::GetBackend(
    const shared_ptr<const ProviderConfig> &config) {
  lock_guard<mutex> lock(m_backendsLock);
  BackendMap::iterator it = m_backends.find(config.get());
  if (it != m_backends.end()) {
    return it->second;
  }
  shared_ptr<Backend> backend = m_backendFactory->MakeBackend(config);
  m_backends[config.get()] = backend;
  DebugInfo("Create " +
            FIO::Client::ProviderFamilyToString(config->GetFamily()) +
            " backend for scheme " + config->GetScheme());
  return backend;
}

}  // namespace FileSystem
}  // namespace FIO
