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

#include "base/Utils.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <string>
#include <utility>
#include <vector>

#include "boost/foreach.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace FIO {

namespace Utils {

using FIO::StringUtils::FormatPath;
using FIO::StringUtils::Split;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

static const char PATH_DELIM = '/';

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path) || path == "./") {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  }
  if (!CreateDirectoryIfNotExists(GetDirName(path))) {
    return false;
  }
  return mkdir(path.c_str(), FIO::Configure::Default::GetDefineDirMode()) ==
             0 ||
         errno == EEXIST;
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  return unlink(path.c_str()) == 0 || errno == ENOENT;
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) {
  return access(path.c_str(), F_OK) == 0;
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return make_pair(false, string("Unable to access ") + FormatPath(path) +
                                ": " + strerror(errno));
  }
  return make_pair(static_cast<bool>(S_ISDIR(st.st_mode)), string());
}

// --------------------------------------------------------------------------
bool IsRootDirectory(const string &path) { return path == "/"; }

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  if (!path.empty() && path[path.size() - 1] == PATH_DELIM) {
    return path;
  }
  return path + PATH_DELIM;
}

// --------------------------------------------------------------------------
string JoinPath(const string &dir, const string &name) {
  if (dir.empty()) {
    return name;
  }
  string::size_type begin = name.find_first_not_of(PATH_DELIM);
  return AppendPathDelim(dir) +
         (begin == string::npos ? string() : name.substr(begin));
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }
  string::size_type end = path.find_last_not_of(PATH_DELIM);
  if (end == string::npos) {
    return "/";
  }
  string::size_type slash = path.rfind(PATH_DELIM, end);
  if (slash == string::npos) {
    return "./";
  }
  string::size_type dirEnd = path.find_last_not_of(PATH_DELIM, slash);
  if (dirEnd == string::npos) {
    return "/";
  }
  return path.substr(0, dirEnd + 1) + PATH_DELIM;
}

// --------------------------------------------------------------------------
bool HasParentReference(const string &path) {
  vector<string> segments = Split(path, PATH_DELIM);
  BOOST_FOREACH (const string &segment, segments) {
    if (segment == "..") {
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
string MakePartialPath(const string &path, const string &writeId) {
  return path + "." + writeId +
         FIO::Configure::Default::GetPartialFileSuffix();
}

}  // namespace Utils
}  // namespace FIO
