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

#include "base/TimeUtils.h"

#include <string.h>  // for memset
#include <time.h>    // for strftime

#include <string>

namespace FIO {

namespace TimeUtils {

using std::string;

namespace {

string FormatGMT(time_t time, const char *format) {
  struct tm res;
  memset(&res, 0, sizeof(struct tm));
  gmtime_r(&time, &res);

  char date[64];
  memset(date, 0, sizeof(date));
  strftime(date, sizeof(date), format, &res);
  return date;
}

}  // namespace

// --------------------------------------------------------------------------
time_t RFC822GMTToSeconds(const string &date) {
  if (date.empty()) {
    return 0L;
  }
  struct tm res;
  memset(&res, 0, sizeof(struct tm));

  static const char *formatGMT = "%a, %d %b %Y %H:%M:%S GMT";
  if (strptime(date.c_str(), formatGMT, &res) == NULL) {
    return 0L;
  }
  return timegm(&res);
}

// --------------------------------------------------------------------------
string SecondsToISO8601Basic(time_t time) {
  return FormatGMT(time, "%Y%m%dT%H%M%SZ");
}

// --------------------------------------------------------------------------
string SecondsToDateStamp(time_t time) { return FormatGMT(time, "%Y%m%d"); }

}  // namespace TimeUtils
}  // namespace FIO
