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

#include "client/BackendFactory.h"

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "client/Backend.h"
#include "client/LocalBackend.h"
#include "client/ProviderConfig.h"
#include "client/S3Backend.h"
#include "client/SMBBackend.h"

namespace FIO {

namespace Client {

using boost::make_shared;
using boost::shared_ptr;
using FIO::Exception::ProviderConfigError;

// --------------------------------------------------------------------------
shared_ptr<Backend> BackendFactory::MakeBackend(
    const shared_ptr<const ProviderConfig> &config) const {
  if (!config) {
    throw ProviderConfigError("", "null provider config");
  }
  shared_ptr<Backend> backend = shared_ptr<Backend>();
  switch (config->GetFamily()) {
    case ProviderFamily::Local: {
      backend = make_shared<LocalBackend>(config);
      break;
    }
    case ProviderFamily::S3Compatible: {
      backend = make_shared<S3Backend>(config);
      break;
    }
    case ProviderFamily::SMB: {
      backend = make_shared<SMBBackend>(config);
      break;
    }
    default: {
      throw ProviderConfigError(
          config->GetScheme(),
          "unsupported provider family " +
              ProviderFamilyToString(config->GetFamily()));
    }
  }
  return backend;
}

}  // namespace Client
}  // namespace FIO
