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

#ifndef FILEIO_BASE_STRINGUTILS_H_
#define FILEIO_BASE_STRINGUTILS_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

namespace FIO {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Split string by delimiter, empty tokens are kept
std::vector<std::string> Split(const std::string &str, char delim);

bool StartsWith(const std::string &str, const std::string &prefix);
bool EndsWith(const std::string &str, const std::string &suffix);

// Parse boolean text
//
// @param  : text such as "true", "1", "yes", "on", "false", "0", "no", "off"
// @return : a pair of {true, value} or {false, false} if not recognized
std::pair<bool, bool> ParseBool(const std::string &str);

// Parse size text
//
// @param  : text such as "4096", "64KB", "8M", "1G"
// @return : a pair of {true, bytes} or {false, 0} if malformed
//
// Suffixes are powers of 1024 and case insensitive.
std::pair<bool, uint64_t> ParseSize(const std::string &str);

// Percent-encode string as RFC 3986 unreserved set
//
// @param  : string, flag to keep '/' unencoded
// @return : encoded string
std::string UriEncode(const std::string &str, bool keepSlash);

std::string HexEncode(const unsigned char *data, size_t len);

// Format path
//
// @param  : path
// @return : formatted string
std::string FormatPath(const std::string &path);
std::string FormatPath(const std::string &from, const std::string &to);

}  // namespace StringUtils
}  // namespace FIO

#endif  // FILEIO_BASE_STRINGUTILS_H_
