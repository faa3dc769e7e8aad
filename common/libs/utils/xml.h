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

#include <memory>
#include <string>
#include <vector>

#include <libxml/tree.h>

#include "common/libs/utils/result.h"

namespace osinstall {

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const;
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

Result<XmlDocPtr> ParseXmlString(const std::string& content);
Result<XmlDocPtr> ParseXmlFile(const std::string& path);

XmlDocPtr NewXmlDocument();

inline const xmlChar* XmlStr(const char* str) {
  return reinterpret_cast<const xmlChar*>(str);
}

bool NameIs(const xmlNode* node, const char* name);

std::vector<xmlNode*> ChildElements(xmlNode* parent);
// nullptr when `parent` has no element child named `name`.
xmlNode* FirstChildElement(xmlNode* parent, const char* name);

// Concatenated text of the node and its descendants.
std::string NodeText(xmlNode* node);

// Pretty-printed markup of a single element and its subtree.
std::string SerializeNode(xmlDoc* doc, xmlNode* node);

Result<std::string> SerializeDocument(xmlDoc* doc);
Result<void> WriteXmlFile(xmlDoc* doc, const std::string& path);

}  // namespace osinstall
