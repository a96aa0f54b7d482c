#include "HtmlDocument.hpp"
#include "Logger.hpp"

#include <libxml/HTMLtree.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

struct XmlCharDeleter {
  void operator()(xmlChar* p) const {
    xmlFree(p);
  }
};
using XmlString = std::unique_ptr<xmlChar, XmlCharDeleter>;

const xmlChar* X(const char* s) {
  return reinterpret_cast<const xmlChar*>(s);
}

std::string ToStd(const xmlChar* s) {
  return s == nullptr ? std::string{}
                      : std::string{reinterpret_cast<const char*>(s)};
}

void Collect(xmlNodePtr node, std::vector<xmlNodePtr>& out) {
  for (xmlNodePtr cur = node; cur != nullptr; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE) {
      out.push_back(cur);
      Collect(cur->children, out);
    }
  }
}
}  // namespace

HtmlDocument HtmlDocument::Parse(const std::string& html,
                                 const std::string& url,
                                 const std::string& encoding) {
  const int options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                      HTML_PARSE_NOWARNING | HTML_PARSE_NONET;
  // libxml2 needs at least one element to build a tree
  const std::string& src = html.empty() ? std::string{"<html></html>"} : html;
  xmlDocPtr doc = htmlReadMemory(src.data(), static_cast<int>(src.size()),
                                 url.c_str(), encoding.c_str(), options);
  if (doc == nullptr) {
    throw std::runtime_error("unparseable HTML document: " + url);
  }
  return HtmlDocument{doc};
}

HtmlDocument HtmlDocument::Clone() const {
  xmlDocPtr copy = xmlCopyDoc(doc_.get(), 1);
  if (copy == nullptr) {
    throw std::runtime_error("xmlCopyDoc failed");
  }
  return HtmlDocument{copy};
}

xmlNodePtr HtmlDocument::FindChild(xmlNodePtr parent, const char* tag) const {
  if (parent == nullptr)
    return nullptr;
  for (xmlNodePtr cur = parent->children; cur != nullptr; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE && Name(cur) == tag)
      return cur;
  }
  return nullptr;
}

xmlNodePtr HtmlDocument::Html() const {
  xmlNodePtr root = xmlDocGetRootElement(doc_.get());
  if (root != nullptr && Name(root) == "html")
    return root;
  return nullptr;
}

xmlNodePtr HtmlDocument::Head() const {
  return FindChild(Html(), "head");
}

xmlNodePtr HtmlDocument::Body() const {
  return FindChild(Html(), "body");
}

xmlNodePtr HtmlDocument::EnsureHead() {
  if (xmlNodePtr head = Head())
    return head;
  xmlNodePtr html = Html();
  if (html == nullptr) {
    html = NewElement("html");
    xmlNodePtr old_root = xmlDocSetRootElement(doc_.get(), html);
    if (old_root != nullptr)
      xmlAddChild(html, old_root);
  }
  xmlNodePtr head = NewElement("head");
  InsertFirst(html, head);
  return head;
}

std::vector<xmlNodePtr> HtmlDocument::Elements() const {
  std::vector<xmlNodePtr> out;
  Collect(xmlDocGetRootElement(doc_.get()), out);
  return out;
}

std::vector<xmlNodePtr> HtmlDocument::ElementsByTag(
  const std::string& tag) const {
  std::vector<xmlNodePtr> out;
  for (xmlNodePtr node : Elements()) {
    if (Name(node) == tag)
      out.push_back(node);
  }
  return out;
}

int HtmlDocument::IndexOf(const xmlNode* node) const {
  auto all = Elements();
  auto it = std::find(all.begin(), all.end(), node);
  return it == all.end() ? -1 : static_cast<int>(it - all.begin());
}

std::optional<std::string> HtmlDocument::BaseHref() const {
  if (xmlNodePtr base = FindChild(Head(), "base"))
    return Attr(base, "href");
  return std::nullopt;
}

std::string HtmlDocument::Serialize() const {
  xmlChar* buf = nullptr;
  int size = 0;
  htmlDocDumpMemoryFormat(doc_.get(), &buf, &size, 0);
  XmlString holder{buf};
  if (buf == nullptr)
    return "";
  return std::string(reinterpret_cast<const char*>(buf),
                     static_cast<size_t>(size));
}

xmlNodePtr HtmlDocument::NewElement(const std::string& tag) const {
  return xmlNewDocNode(doc_.get(), nullptr, X(tag.c_str()), nullptr);
}

std::string HtmlDocument::Name(const xmlNode* node) {
  if (node == nullptr || node->name == nullptr)
    return "";
  std::string name = ToStd(node->name);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return name;
}

bool HtmlDocument::HasAttr(const xmlNode* node, const char* name) {
  return node != nullptr && xmlHasProp(node, X(name)) != nullptr;
}

std::optional<std::string> HtmlDocument::Attr(const xmlNode* node,
                                              const char* name) {
  if (!HasAttr(node, name))
    return std::nullopt;
  XmlString value{xmlGetProp(node, X(name))};
  return ToStd(value.get());
}

void HtmlDocument::SetAttr(xmlNodePtr node, const char* name,
                           const std::string& value) {
  xmlSetProp(node, X(name), X(value.c_str()));
}

void HtmlDocument::SetFlag(xmlNodePtr node, const char* name) {
  if (!HasAttr(node, name))
    xmlNewProp(node, X(name), nullptr);
}

void HtmlDocument::RemoveAttr(xmlNodePtr node, const char* name) {
  if (xmlAttrPtr attr = xmlHasProp(node, X(name)))
    xmlRemoveProp(attr);
}

std::vector<std::string> HtmlDocument::Classes(const xmlNode* node) {
  std::vector<std::string> out;
  auto cls = Attr(node, "class");
  if (!cls.has_value())
    return out;
  std::istringstream in(*cls);
  std::string token;
  while (in >> token)
    out.push_back(token);
  return out;
}

std::string HtmlDocument::Text(const xmlNode* node) {
  XmlString content{xmlNodeGetContent(node)};
  return ToStd(content.get());
}

void HtmlDocument::SetText(xmlNodePtr node, const std::string& text) {
  xmlNodePtr child = node->children;
  while (child != nullptr) {
    xmlNodePtr next = child->next;
    xmlUnlinkNode(child);
    xmlFreeNode(child);
    child = next;
  }
  xmlAddChild(node, xmlNewDocText(node->doc, X(text.c_str())));
}

bool HtmlDocument::IsElement(const xmlNode* node) {
  return node != nullptr && node->type == XML_ELEMENT_NODE;
}

void HtmlDocument::InsertFirst(xmlNodePtr parent, xmlNodePtr child) {
  if (parent->children != nullptr)
    xmlAddPrevSibling(parent->children, child);
  else
    xmlAddChild(parent, child);
}

void HtmlDocument::InsertBefore(xmlNodePtr sibling, xmlNodePtr node) {
  xmlAddPrevSibling(sibling, node);
}

void HtmlDocument::InsertAfter(xmlNodePtr sibling, xmlNodePtr node) {
  xmlAddNextSibling(sibling, node);
}
