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

#ifndef FILEIO_CLIENT_BACKENDFACTORY_H_
#define FILEIO_CLIENT_BACKENDFACTORY_H_

#include "boost/shared_ptr.hpp"

namespace FIO {

namespace Client {

class Backend;
class ProviderConfig;

//
// BackendFactory
//
// Creates the backend variant of a config by its provider family tag.
// Subclass to plug in other variants.
//
class BackendFactory {
 public:
  BackendFactory() {}
  virtual ~BackendFactory() {}

 public:
  // Throws ProviderConfigError if the backend cannot be set up
  virtual boost::shared_ptr<Backend> MakeBackend(
      const boost::shared_ptr<const ProviderConfig> &config) const;
};

}  // namespace Client
}  // namespace FIO

#endif  // FILEIO_CLIENT_BACKENDFACTORY_H_
