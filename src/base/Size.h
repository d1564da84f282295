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

#ifndef FILEIO_BASE_SIZE_H_
#define FILEIO_BASE_SIZE_H_

#include <stdint.h>  // for uint64_t

namespace FIO {

namespace Size {

// Byte sizes of the default tiers and thresholds
static const uint64_t KB8 = 8 * 1024;
static const uint64_t KB64 = 64 * 1024;
static const uint64_t KB256 = 256 * 1024;

static const uint64_t MB1 = 1024 * 1024;
static const uint64_t MB4 = 4 * MB1;
static const uint64_t MB5 = 5 * MB1;
static const uint64_t MB8 = 8 * MB1;
static const uint64_t MB10 = 10 * MB1;
static const uint64_t MB50 = 50 * MB1;
static const uint64_t MB100 = 100 * MB1;

static const uint64_t GB1 = 1024 * MB1;
static const uint64_t GB5 = 5 * GB1;

}  // namespace Size
}  // namespace FIO

#endif  // FILEIO_BASE_SIZE_H_
