//
// Copyright (C) 2024 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "common/libs/utils/plist.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/json.h>

#include "common/libs/utils/result_matchers.h"

namespace osinstall {

using ::testing::HasSubstr;

TEST(PlistTest, ParsesSystemVersion) {
  const std::string content = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
	<key>ProductBuildVersion</key>
	<string>13C64</string>
	<key>ProductName</key>
	<string>Mac OS X</string>
	<key>ProductVersion</key>
	<string>10.9.2</string>
</dict>
</plist>
)";
  auto plist = ParsePlistString(content);

  ASSERT_THAT(plist, IsOk());
  EXPECT_EQ((*plist)["ProductVersion"].asString(), "10.9.2");
  EXPECT_EQ((*plist)["ProductBuildVersion"].asString(), "13C64");
}

TEST(PlistTest, ParsesScalarTypes) {
  const std::string content = R"(<plist version="1.0"><dict>
  <key>count</key><integer>-42</integer>
  <key>ratio</key><real>0.5</real>
  <key>yes</key><true/>
  <key>no</key><false/>
  <key>when</key><date>2014-02-25T18:00:00Z</date>
  <key>blob</key><data>
    AAEC
    AwQ=
  </data>
  <key>list</key><array><string>a</string><integer>1</integer></array>
</dict></plist>)";
  auto plist = ParsePlistString(content);

  ASSERT_THAT(plist, IsOk());
  const Json::Value& value = *plist;
  EXPECT_EQ(value["count"].asInt64(), -42);
  EXPECT_DOUBLE_EQ(value["ratio"].asDouble(), 0.5);
  EXPECT_TRUE(value["yes"].asBool());
  EXPECT_FALSE(value["no"].asBool());
  EXPECT_EQ(value["when"].asString(), "2014-02-25T18:00:00Z");
  EXPECT_EQ(value["blob"].asString(), "AAECAwQ=");
  ASSERT_EQ(value["list"].size(), 2u);
  EXPECT_EQ(value["list"][0].asString(), "a");
  EXPECT_EQ(value["list"][1].asInt(), 1);
}

TEST(PlistTest, RejectsMalformedDocuments) {
  EXPECT_THAT(ParsePlistString("<plist><dict><key>a</key></dict>"),
              IsError());
  EXPECT_THAT(ParsePlistString("<plist><dict><key>a</key></dict></plist>"),
              IsError());
  EXPECT_THAT(ParsePlistString("<foo><string>a</string></foo>"), IsError());
  EXPECT_THAT(ParsePlistString("<plist><integer>x</integer></plist>"),
              IsError());
  EXPECT_THAT(ParsePlistString("bplist00"),
              IsErrorAndMessage(HasSubstr("Binary")));
}

TEST(PlistTest, SerializesWithDoctype) {
  Json::Value value(Json::objectValue);
  value["IFPkgFlagInstalledSize"] = Json::Value(Json::Int64{8388608});
  value["IFPkgFormatVersion"] = 0.1;
  value["CFBundleIdentifier"] = "com.googlecode.munki.installosx";

  auto serialized = SerializePlist(value);

  ASSERT_THAT(serialized, IsOk());
  EXPECT_THAT(*serialized, HasSubstr("<!DOCTYPE plist PUBLIC"));
  EXPECT_THAT(*serialized, HasSubstr("<integer>8388608</integer>"));
  EXPECT_THAT(*serialized, HasSubstr("<real>0.1</real>"));
  EXPECT_THAT(*serialized,
              HasSubstr("<string>com.googlecode.munki.installosx</string>"));
}

TEST(PlistTest, WrittenFileParsesBack) {
  android::base::TemporaryDir dir;
  const std::string path = std::string(dir.path) + "/OSInstall.collection";
  Json::Value list(Json::arrayValue);
  list.append("/System/Installation/Packages/OSInstall.mpkg");
  list.append("/System/Installation/Packages/OSInstall.mpkg");
  list.append("/System/Installation/Packages/Extra & More.pkg");

  ASSERT_THAT(WritePlistFile(list, path), IsOk());
  auto parsed = ParsePlistFile(path);

  ASSERT_THAT(parsed, IsOk());
  EXPECT_EQ(*parsed, list);
}

TEST(PlistTest, NullCannotBeSerialized) {
  Json::Value value(Json::objectValue);
  value["missing"] = Json::Value();
  EXPECT_THAT(SerializePlist(value), IsError());
}

}  // namespace osinstall
