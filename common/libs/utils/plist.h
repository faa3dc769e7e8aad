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

#pragma once

#include <string>

#include <json/json.h>

#include "common/libs/utils/result.h"

namespace osinstall {

/*
 * XML property lists are represented as Json::Value trees:
 *
 *   <dict>            objectValue
 *   <array>           arrayValue
 *   <string>          stringValue
 *   <integer>         intValue (Int64)
 *   <real>            realValue
 *   <true/>, <false/> booleanValue
 *   <date>, <data>    stringValue holding the element text
 *
 * Only the XML format is supported, binary property lists are rejected.
 */
Result<Json::Value> ParsePlistString(const std::string& content);
Result<Json::Value> ParsePlistFile(const std::string& path);

Result<std::string> SerializePlist(const Json::Value& value);
Result<void> WritePlistFile(const Json::Value& value, const std::string& path);

}  // namespace osinstall
