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

#ifndef FILEIO_CONFIGURE_ENVIRONMENT_H_
#define FILEIO_CONFIGURE_ENVIRONMENT_H_

#include <map>
#include <string>

#include "boost/shared_ptr.hpp"

namespace FIO {

namespace Configure {

//
// Environment
//
// Source of raw key/value settings. Names are matched exactly.
//
class Environment {
 public:
  virtual ~Environment() {}

  // Get value of a variable
  //
  // @param  : name, value to fill
  // @return : true if the variable is set
  virtual bool Get(const std::string &name, std::string *value) const = 0;

  // Get value of a variable, or the default if unset or empty
  std::string GetOrDefault(const std::string &name,
                           const std::string &defaultValue) const;

  bool Has(const std::string &name) const;
};

// Reads the process environment
class ProcessEnvironment : public Environment {
 public:
  bool Get(const std::string &name, std::string *value) const;
};

// Reads from an in-memory table
class MapEnvironment : public Environment {
 public:
  MapEnvironment() {}
  explicit MapEnvironment(const std::map<std::string, std::string> &vars)
      : m_vars(vars) {}

  bool Get(const std::string &name, std::string *value) const;

  void Set(const std::string &name, const std::string &value) {
    m_vars[name] = value;
  }
  void Unset(const std::string &name) { m_vars.erase(name); }

 private:
  std::map<std::string, std::string> m_vars;
};

boost::shared_ptr<Environment> GetProcessEnvironment();

}  // namespace Configure
}  // namespace FIO

#endif  // FILEIO_CONFIGURE_ENVIRONMENT_H_
