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

#ifndef FILEIO_CLIENT_PROTOCOL_H_
#define FILEIO_CLIENT_PROTOCOL_H_

#include <stdint.h>

#include <string>

namespace FIO {

namespace Client {

namespace Http {

struct Protocol {
  enum Value { HTTP, HTTPS };
};

std::string ProtocolToString(Protocol::Value protocol);
Protocol::Value StringToProtocol(const std::string &name);

struct Endpoint {
  Endpoint() : protocol(Protocol::HTTPS), port(443) {}

  // "https://host" or "http://host:9000", default port omitted
  std::string ToString() const;
  // "host" or "host:9000", as used in the Host header
  std::string HostHeader() const;
  bool HasDefaultPort() const;

  Protocol::Value protocol;
  std::string host;
  uint16_t port;
};

// Prepend protocol to an endpoint which has none
//
// @param  : raw endpoint, flag to force http
// @return : endpoint with protocol
//
// "https://" is used unless a port other than 443 is present or http is
// forced, then "http://". A trailing '/' is removed.
std::string NormalizeEndpoint(const std::string &endpoint, bool forceHttp);

// Parse "protocol://host[:port][/...]"
//
// @param  : endpoint url, endpoint to fill
// @return : false if malformed
bool ParseEndpoint(const std::string &url, Endpoint *endpoint);

}  // namespace Http
}  // namespace Client
}  // namespace FIO

#endif  // FILEIO_CLIENT_PROTOCOL_H_
