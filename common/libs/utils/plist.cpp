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

#include <cerrno>
#include <cstring>
#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/parsedouble.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>
#include <libxml/tree.h>

#include "common/libs/utils/xml.h"

namespace osinstall {
namespace {

constexpr char kBinaryPlistMagic[] = "bplist";
constexpr char kPlistPublicId[] = "-//Apple//DTD PLIST 1.0//EN";
constexpr char kPlistSystemId[] =
    "http://www.apple.com/DTDs/PropertyList-1.0.dtd";

std::string ElementName(const xmlNode* node) {
  return reinterpret_cast<const char*>(node->name);
}

Result<Json::Value> ParseValue(xmlNode* node) {
  const auto name = ElementName(node);
  if (name == "dict") {
    Json::Value dict(Json::objectValue);
    auto children = ChildElements(node);
    OI_EXPECT(children.size() % 2 == 0,
              "<dict> with an odd number of children on line " << node->line);
    for (size_t i = 0; i < children.size(); i += 2) {
      OI_EXPECT(NameIs(children[i], "key"),
                "Expected <key> but found <" << ElementName(children[i])
                                             << "> on line "
                                             << children[i]->line);
      auto key = NodeText(children[i]);
      dict[key] = OI_EXPECT(ParseValue(children[i + 1]));
    }
    return dict;
  } else if (name == "array") {
    Json::Value array(Json::arrayValue);
    for (xmlNode* child : ChildElements(node)) {
      array.append(OI_EXPECT(ParseValue(child)));
    }
    return array;
  } else if (name == "string" || name == "date") {
    return Json::Value(NodeText(node));
  } else if (name == "data") {
    // Base64 payloads are commonly wrapped over several lines.
    auto text = NodeText(node);
    std::string compact;
    for (char c : text) {
      if (!isspace(static_cast<unsigned char>(c))) {
        compact.push_back(c);
      }
    }
    return Json::Value(compact);
  } else if (name == "integer") {
    auto text = android::base::Trim(NodeText(node));
    int64_t integer = 0;
    OI_EXPECT(android::base::ParseInt(text, &integer),
              "Invalid <integer> \"" << text << "\" on line " << node->line);
    return Json::Value(static_cast<Json::Int64>(integer));
  } else if (name == "real") {
    auto text = android::base::Trim(NodeText(node));
    double real = 0;
    OI_EXPECT(android::base::ParseDouble(text, &real),
              "Invalid <real> \"" << text << "\" on line " << node->line);
    return Json::Value(real);
  } else if (name == "true") {
    return Json::Value(true);
  } else if (name == "false") {
    return Json::Value(false);
  }
  return OI_ERR("Unknown property list element <" << name << "> on line "
                                                  << node->line);
}

Result<void> AppendValue(xmlNode* parent, const Json::Value& value) {
  switch (value.type()) {
    case Json::objectValue: {
      xmlNode* dict = xmlNewChild(parent, nullptr, XmlStr("dict"), nullptr);
      for (const auto& key : value.getMemberNames()) {
        xmlNewTextChild(dict, nullptr, XmlStr("key"), XmlStr(key.c_str()));
        OI_EXPECT(AppendValue(dict, value[key]));
      }
      return {};
    }
    case Json::arrayValue: {
      xmlNode* array = xmlNewChild(parent, nullptr, XmlStr("array"), nullptr);
      for (const auto& element : value) {
        OI_EXPECT(AppendValue(array, element));
      }
      return {};
    }
    case Json::stringValue:
      xmlNewTextChild(parent, nullptr, XmlStr("string"),
                      XmlStr(value.asCString()));
      return {};
    case Json::intValue:
      xmlNewTextChild(parent, nullptr, XmlStr("integer"),
                      XmlStr(std::to_string(value.asInt64()).c_str()));
      return {};
    case Json::uintValue:
      xmlNewTextChild(parent, nullptr, XmlStr("integer"),
                      XmlStr(std::to_string(value.asUInt64()).c_str()));
      return {};
    case Json::realValue:
      xmlNewTextChild(parent, nullptr, XmlStr("real"),
                      XmlStr(fmt::format("{}", value.asDouble()).c_str()));
      return {};
    case Json::booleanValue:
      xmlNewChild(parent, nullptr, XmlStr(value.asBool() ? "true" : "false"),
                  nullptr);
      return {};
    case Json::nullValue:
      break;
  }
  return OI_ERR("Property lists cannot represent null values");
}

}  // namespace

Result<Json::Value> ParsePlistString(const std::string& content) {
  OI_EXPECT(!android::base::StartsWith(content, kBinaryPlistMagic),
            "Binary property lists are not supported");
  auto doc = OI_EXPECT(ParseXmlString(content));
  xmlNode* root = xmlDocGetRootElement(doc.get());
  OI_EXPECT(NameIs(root, "plist"),
            "Root element is <" << ElementName(root) << ">, not <plist>");
  auto children = ChildElements(root);
  OI_EXPECT_EQ(children.size(), 1u, "<plist> must hold exactly one value");
  return OI_EXPECT(ParseValue(children[0]));
}

Result<Json::Value> ParsePlistFile(const std::string& path) {
  std::string content;
  OI_EXPECTF(android::base::ReadFileToString(path, &content),
             "Could not read \"{}\": {}", path, strerror(errno));
  return OI_EXPECTF(ParsePlistString(content), "Malformed property list \"{}\"",
                    path);
}

Result<std::string> SerializePlist(const Json::Value& value) {
  auto doc = NewXmlDocument();
  OI_EXPECT(doc != nullptr, "Could not allocate an XML document");
  xmlCreateIntSubset(doc.get(), XmlStr("plist"), XmlStr(kPlistPublicId),
                     XmlStr(kPlistSystemId));
  xmlNode* root = xmlNewNode(nullptr, XmlStr("plist"));
  xmlNewProp(root, XmlStr("version"), XmlStr("1.0"));
  xmlDocSetRootElement(doc.get(), root);
  OI_EXPECT(AppendValue(root, value));
  return OI_EXPECT(SerializeDocument(doc.get()));
}

Result<void> WritePlistFile(const Json::Value& value, const std::string& path) {
  auto serialized = OI_EXPECT(SerializePlist(value));
  OI_EXPECTF(android::base::WriteStringToFile(serialized, path),
             "Failed to write \"{}\": {}", path, strerror(errno));
  return {};
}

}  // namespace osinstall
