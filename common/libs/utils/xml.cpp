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

#include "common/libs/utils/xml.h"

#include <cstring>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>

namespace osinstall {
namespace {

// Whitespace-only text is dropped so that serialization can re-indent.
constexpr int kParseOptions =
    XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR |
    XML_PARSE_NOWARNING;

std::string LastXmlError() {
  const xmlError* error = xmlGetLastError();
  if (error == nullptr || error->message == nullptr) {
    return "unknown error";
  }
  return fmt::format("line {}: {}", error->line,
                     android::base::Trim(error->message));
}

}  // namespace

void XmlDocDeleter::operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }

Result<XmlDocPtr> ParseXmlString(const std::string& content) {
  xmlResetLastError();
  XmlDocPtr doc(xmlReadMemory(content.data(), static_cast<int>(content.size()),
                              nullptr, nullptr, kParseOptions));
  if (!doc) {
    return OI_ERR("XML parsing failed, " << LastXmlError());
  }
  OI_EXPECT(xmlDocGetRootElement(doc.get()) != nullptr,
            "XML document has no root element");
  return std::move(doc);
}

Result<XmlDocPtr> ParseXmlFile(const std::string& path) {
  std::string content;
  OI_EXPECTF(android::base::ReadFileToString(path, &content),
             "Could not read \"{}\"", path);
  return OI_EXPECTF(ParseXmlString(content), "Malformed XML in \"{}\"", path);
}

XmlDocPtr NewXmlDocument() { return XmlDocPtr(xmlNewDoc(XmlStr("1.0"))); }

bool NameIs(const xmlNode* node, const char* name) {
  return node != nullptr && node->type == XML_ELEMENT_NODE &&
         xmlStrcmp(node->name, XmlStr(name)) == 0;
}

std::vector<xmlNode*> ChildElements(xmlNode* parent) {
  std::vector<xmlNode*> children;
  if (parent == nullptr) {
    return children;
  }
  for (xmlNode* child = parent->children; child != nullptr;
       child = child->next) {
    if (child->type == XML_ELEMENT_NODE) {
      children.push_back(child);
    }
  }
  return children;
}

xmlNode* FirstChildElement(xmlNode* parent, const char* name) {
  for (xmlNode* child : ChildElements(parent)) {
    if (NameIs(child, name)) {
      return child;
    }
  }
  return nullptr;
}

std::string NodeText(xmlNode* node) {
  if (node == nullptr) {
    return "";
  }
  xmlChar* content = xmlNodeGetContent(node);
  if (content == nullptr) {
    return "";
  }
  std::string text(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return text;
}

std::string SerializeNode(xmlDoc* doc, xmlNode* node) {
  std::unique_ptr<xmlBuffer, void (*)(xmlBuffer*)> buffer(xmlBufferCreate(),
                                                          xmlBufferFree);
  if (!buffer) {
    LOG(ERROR) << "Could not allocate an XML buffer";
    return "";
  }
  if (xmlNodeDump(buffer.get(), doc, node, 0, /* format */ 1) < 0) {
    LOG(ERROR) << "Could not serialize <"
               << reinterpret_cast<const char*>(node->name) << ">";
    return "";
  }
  return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())));
}

Result<std::string> SerializeDocument(xmlDoc* doc) {
  xmlChar* output = nullptr;
  int size = 0;
  xmlDocDumpFormatMemoryEnc(doc, &output, &size, "UTF-8", /* format */ 1);
  OI_EXPECT(output != nullptr, "XML serialization failed");
  std::string serialized(reinterpret_cast<const char*>(output),
                         static_cast<size_t>(size));
  xmlFree(output);
  return serialized;
}

Result<void> WriteXmlFile(xmlDoc* doc, const std::string& path) {
  auto serialized = OI_EXPECT(SerializeDocument(doc));
  OI_EXPECTF(android::base::WriteStringToFile(serialized, path),
             "Failed to write \"{}\": {}", path, strerror(errno));
  return {};
}

}  // namespace osinstall
