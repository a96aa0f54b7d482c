#pragma once

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Owning wrapper around a libxml2 HTML tree.
class HtmlDocument {
 public:
  // Lenient parse (recovering, no network, no error output). Throws
  // std::runtime_error when libxml2 produces no document at all.
  static HtmlDocument Parse(const std::string& html, const std::string& url,
                            const std::string& encoding = "UTF-8");

  HtmlDocument(HtmlDocument&&) noexcept = default;
  HtmlDocument& operator=(HtmlDocument&&) noexcept = default;
  HtmlDocument(const HtmlDocument&) = delete;
  HtmlDocument& operator=(const HtmlDocument&) = delete;

  // Deep copy; element order (and so element indices) match the original.
  HtmlDocument Clone() const;

  xmlDocPtr get() const {
    return doc_.get();
  }

  xmlNodePtr Html() const;
  xmlNodePtr Head() const;
  xmlNodePtr Body() const;
  // Returns <head>, creating it as the first child of <html> when missing.
  xmlNodePtr EnsureHead();

  // All element nodes in document (pre-)order.
  std::vector<xmlNodePtr> Elements() const;
  std::vector<xmlNodePtr> ElementsByTag(const std::string& tag) const;
  // Index of `node` in Elements(), or -1.
  int IndexOf(const xmlNode* node) const;

  // <base href> when present.
  std::optional<std::string> BaseHref() const;

  // Same tree in, same bytes out.
  std::string Serialize() const;

  xmlNodePtr NewElement(const std::string& tag) const;

  static std::string Name(const xmlNode* node);
  static bool HasAttr(const xmlNode* node, const char* name);
  static std::optional<std::string> Attr(const xmlNode* node,
                                         const char* name);
  static void SetAttr(xmlNodePtr node, const char* name,
                      const std::string& value);
  // Valueless attribute, serialized minimized (`defer`).
  static void SetFlag(xmlNodePtr node, const char* name);
  static void RemoveAttr(xmlNodePtr node, const char* name);
  static std::vector<std::string> Classes(const xmlNode* node);
  static std::string Text(const xmlNode* node);
  static void SetText(xmlNodePtr node, const std::string& text);
  static bool IsElement(const xmlNode* node);

  static void InsertFirst(xmlNodePtr parent, xmlNodePtr child);
  static void InsertBefore(xmlNodePtr sibling, xmlNodePtr node);
  static void InsertAfter(xmlNodePtr sibling, xmlNodePtr node);

 private:
  struct DocDeleter {
    void operator()(xmlDocPtr d) const {
      xmlFreeDoc(d);
    }
  };

  explicit HtmlDocument(xmlDocPtr doc) : doc_{doc} {
  }

  xmlNodePtr FindChild(xmlNodePtr parent, const char* tag) const;

  std::unique_ptr<xmlDoc, DocDeleter> doc_;
};
