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

#ifndef FILEIO_BASE_UTILS_H_
#define FILEIO_BASE_UTILS_H_

#include <string>
#include <utility>

namespace FIO {

namespace Utils {

// Create directory and its parents if they don't exist
//
// @param  : dir path
// @return : true if the directory exists afterwards
bool CreateDirectoryIfNotExists(const std::string &path);

// Remove file, a missing file counts as removed
bool RemoveFileIfExists(const std::string &path);

bool FileExists(const std::string &path);

// Check if path is a directory
//
// @param  : path
// @return : {isDirectory, ""} or {false, message} if path is not accessible
std::pair<bool, std::string> IsDirectory(const std::string &path);

bool IsRootDirectory(const std::string &path);

// Append '/' to path unless it already ends with one
std::string AppendPathDelim(const std::string &path);

// Join two path components with exactly one '/' between them
std::string JoinPath(const std::string &dir, const std::string &name);

// Directory of a file path, ending with '/'
//
// "/tmp/a/b" gives "/tmp/a/", "b" gives "./"
std::string GetDirName(const std::string &path);

// Whether any segment of path is ".."
bool HasParentReference(const std::string &path);

// Sibling file an in-progress write of path goes to
//
// @param  : target path, write id
// @return : "<path>.<writeId><partial suffix>"
std::string MakePartialPath(const std::string &path,
                            const std::string &writeId);

}  // namespace Utils
}  // namespace FIO

#endif  // FILEIO_BASE_UTILS_H_
