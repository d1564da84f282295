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

#include "base/StringUtils.h"

#include <stdlib.h>  // for strtoull

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"

namespace FIO {

namespace StringUtils {

using std::make_pair;
using std::pair;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::tolower(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string ToUpper(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::toupper(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string LTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::iterator pos = std::find_if(copy.begin(), copy.end(), ch != _1);
  copy.erase(copy.begin(), pos);
  return copy;
}

// --------------------------------------------------------------------------
string RTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::reverse_iterator rpos =
      std::find_if(copy.rbegin(), copy.rend(), ch != _1);
  copy.erase(rpos.base(), copy.end());
  return copy;
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  return LTrim(RTrim(str, ch), ch);
}

// --------------------------------------------------------------------------
vector<string> Split(const string &str, char delim) {
  vector<string> tokens;
  string::size_type start = 0;
  string::size_type pos = str.find(delim);
  while (pos != string::npos) {
    tokens.push_back(str.substr(start, pos - start));
    start = pos + 1;
    pos = str.find(delim, start);
  }
  tokens.push_back(str.substr(start));
  return tokens;
}

// --------------------------------------------------------------------------
bool StartsWith(const string &str, const string &prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

// --------------------------------------------------------------------------
bool EndsWith(const string &str, const string &suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// --------------------------------------------------------------------------
pair<bool, bool> ParseBool(const string &str) {
  string val = ToLower(Trim(str, ' '));
  if (val == "true" || val == "1" || val == "yes" || val == "on") {
    return make_pair(true, true);
  } else if (val == "false" || val == "0" || val == "no" || val == "off") {
    return make_pair(true, false);
  }
  return make_pair(false, false);
}

// --------------------------------------------------------------------------
pair<bool, uint64_t> ParseSize(const string &str) {
  string val = ToUpper(Trim(str, ' '));
  if (val.empty() || !std::isdigit(static_cast<unsigned char>(val[0]))) {
    return make_pair(false, 0);
  }

  string::size_type pos = 0;
  while (pos < val.size() &&
         std::isdigit(static_cast<unsigned char>(val[pos]))) {
    ++pos;
  }
  uint64_t number = strtoull(val.substr(0, pos).c_str(), NULL, 10);

  string suffix = Trim(val.substr(pos), ' ');
  if (!suffix.empty() && suffix[suffix.size() - 1] == 'B') {
    suffix.erase(suffix.size() - 1);
  }
  uint64_t unit = 1;
  if (suffix.empty()) {
    unit = 1;
  } else if (suffix == "K") {
    unit = 1024;
  } else if (suffix == "M") {
    unit = 1024 * 1024;
  } else if (suffix == "G") {
    unit = 1024 * 1024 * 1024;
  } else {
    return make_pair(false, 0);
  }
  return make_pair(true, number * unit);
}

// --------------------------------------------------------------------------
string UriEncode(const string &str, bool keepSlash) {
  static const char *hex = "0123456789ABCDEF";
  string encoded;
  encoded.reserve(str.size() * 3);
  BOOST_FOREACH(char c, str) {
    unsigned char ch = static_cast<unsigned char>(c);
    if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' ||
        ch == '~' || (keepSlash && ch == '/')) {
      encoded.append(1, c);
    } else {
      encoded.append(1, '%');
      encoded.append(1, hex[ch >> 4]);
      encoded.append(1, hex[ch & 0x0F]);
    }
  }
  return encoded;
}

// --------------------------------------------------------------------------
string HexEncode(const unsigned char *data, size_t len) {
  static const char *hex = "0123456789abcdef";
  string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.append(1, hex[data[i] >> 4]);
    out.append(1, hex[data[i] & 0x0F]);
  }
  return out;
}

// --------------------------------------------------------------------------
string FormatPath(const string &path) { return "[path=" + path + "]"; }

// --------------------------------------------------------------------------
string FormatPath(const string &from, const string &to) {
  return "[from=" + from + " to=" + to + "]";
}

}  // namespace StringUtils
}  // namespace FIO
