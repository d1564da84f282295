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
#include <time.h>

#include <string>

#include "gtest/gtest.h"

#include "base/TimeUtils.h"

using std::string;

TEST(TimeUtilsTest, RFC822GMT) {
  string epoch = "Thu, 01 Jan 1970 00:00:00 GMT";
  EXPECT_EQ(FIO::TimeUtils::RFC822GMTToSeconds(epoch), 0);

  time_t secondsOneHour = 3600;
  string oneHourSinceEpoch = "Thu, 01 Jan 1970 01:00:00 GMT";
  EXPECT_EQ(FIO::TimeUtils::RFC822GMTToSeconds(oneHourSinceEpoch),
            secondsOneHour);

  // Last-Modified of an object
  EXPECT_EQ(1369353600, FIO::TimeUtils::RFC822GMTToSeconds(
                            "Fri, 24 May 2013 00:00:00 GMT"));
}

TEST(TimeUtilsTest, ISO8601Basic) {
  // 2013-05-24 00:00:00 UTC
  time_t time = 1369353600;
  EXPECT_EQ("20130524T000000Z", FIO::TimeUtils::SecondsToISO8601Basic(time));
  EXPECT_EQ("20130524", FIO::TimeUtils::SecondsToDateStamp(time));

  EXPECT_EQ("19700101T010203Z", FIO::TimeUtils::SecondsToISO8601Basic(3723));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
