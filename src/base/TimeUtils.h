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

#ifndef FILEIO_BASE_TIMEUTILS_H_
#define FILEIO_BASE_TIMEUTILS_H_

#include <time.h>

#include <string>

namespace FIO {

namespace TimeUtils {

// Parse "Tue, 15 Nov 1994 08:12:31 GMT"
time_t RFC822GMTToSeconds(const std::string &date);

// Format as "19941115T081231Z"
std::string SecondsToISO8601Basic(time_t time);

// Format as "19941115"
std::string SecondsToDateStamp(time_t time);

}  // namespace TimeUtils
}  // namespace FIO

#endif  // FILEIO_BASE_TIMEUTILS_H_
