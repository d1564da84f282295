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

#include "configure/Environment.h"

#include <stdlib.h>  // for getenv

#include <map>
#include <string>

#include "boost/make_shared.hpp"

namespace FIO {

namespace Configure {

using std::string;

// --------------------------------------------------------------------------
string Environment::GetOrDefault(const string &name,
                                 const string &defaultValue) const {
  string value;
  if (Get(name, &value) && !value.empty()) {
    return value;
  }
  return defaultValue;
}

// --------------------------------------------------------------------------
bool Environment::Has(const string &name) const {
  string value;
  return Get(name, &value) && !value.empty();
}

// --------------------------------------------------------------------------
bool ProcessEnvironment::Get(const string &name, string *value) const {
  const char *val = getenv(name.c_str());
  if (val == NULL) {
    return false;
  }
  if (value != NULL) {
    value->assign(val);
  }
  return true;
}

// --------------------------------------------------------------------------
bool MapEnvironment::Get(const string &name, string *value) const {
  std::map<string, string>::const_iterator it = m_vars.find(name);
  if (it == m_vars.end()) {
    return false;
  }
  if (value != NULL) {
    value->assign(it->second);
  }
  return true;
}

// --------------------------------------------------------------------------
boost::shared_ptr<Environment> GetProcessEnvironment() {
  return boost::make_shared<ProcessEnvironment>();
}

}  // namespace Configure
}  // namespace FIO
