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

#include "client/Protocol.h"

#include <stdlib.h>  // for strtoul

#include <string>

#include "boost/exception/to_string.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace FIO {

namespace Client {

namespace Http {

using boost::to_string;
using FIO::StringUtils::EndsWith;
using FIO::StringUtils::StartsWith;
using FIO::StringUtils::ToLower;
using FIO::StringUtils::Trim;
using std::string;

static const char* const HTTP_NAME = "http";
static const char* const HTTPS_NAME = "https";

// --------------------------------------------------------------------------
string ProtocolToString(Protocol::Value protocol) {
  return protocol == Protocol::HTTP ? HTTP_NAME : HTTPS_NAME;
}

// --------------------------------------------------------------------------
Protocol::Value StringToProtocol(const string& name) {
  string str = ToLower(Trim(name, ' '));
  return str == HTTP_NAME ? Protocol::HTTP : Protocol::HTTPS;
}

// --------------------------------------------------------------------------
bool Endpoint::HasDefaultPort() const {
  return port == FIO::Configure::Default::GetDefaultPort(
                     ProtocolToString(protocol));
}

// --------------------------------------------------------------------------
string Endpoint::HostHeader() const {
  return HasDefaultPort() ? host : host + ":" + to_string(port);
}

// --------------------------------------------------------------------------
string Endpoint::ToString() const {
  return ProtocolToString(protocol) + "://" + HostHeader();
}

// --------------------------------------------------------------------------
string NormalizeEndpoint(const string& endpoint, bool forceHttp) {
  string value = Trim(endpoint, ' ');
  while (EndsWith(value, "/")) {
    value.erase(value.size() - 1);
  }
  if (value.empty() || StartsWith(ToLower(value), HTTP_NAME)) {
    return value;
  }
  string prefix = HTTPS_NAME;
  if (forceHttp) {
    prefix = HTTP_NAME;
  } else if (value.find(':') != string::npos && !EndsWith(value, ":443")) {
    // explicit port, likely a plain http service
    prefix = HTTP_NAME;
  }
  return prefix + "://" + value;
}

// --------------------------------------------------------------------------
bool ParseEndpoint(const string& url, Endpoint* endpoint) {
  if (endpoint == NULL) {
    return false;
  }
  string::size_type sep = url.find("://");
  if (sep == string::npos || sep == 0) {
    return false;
  }
  string protocol = ToLower(url.substr(0, sep));
  if (protocol != HTTP_NAME && protocol != HTTPS_NAME) {
    return false;
  }
  string rest = url.substr(sep + 3);
  string::size_type slash = rest.find('/');
  string authority = slash == string::npos ? rest : rest.substr(0, slash);
  if (authority.empty()) {
    return false;
  }

  Endpoint result;
  result.protocol = StringToProtocol(protocol);
  string::size_type colon = authority.rfind(':');
  if (colon != string::npos) {
    string port = authority.substr(colon + 1);
    if (port.empty() || port.find_first_not_of("0123456789") != string::npos) {
      return false;
    }
    unsigned long num = strtoul(port.c_str(), NULL, 10);  // NOLINT
    if (num == 0 || num > 65535) {
      return false;
    }
    result.port = static_cast<uint16_t>(num);
    result.host = authority.substr(0, colon);
  } else {
    result.port = FIO::Configure::Default::GetDefaultPort(protocol);
    result.host = authority;
  }
  if (result.host.empty()) {
    return false;
  }
  *endpoint = result;
  return true;
}

}  // namespace Http
}  // namespace Client
}  // namespace FIO
