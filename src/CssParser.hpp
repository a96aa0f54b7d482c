#pragma once

#include <libxml/tree.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

// One top-level or nested CSS rule, keeping its source text.
struct CssRule {
  enum class Type { Style, Media, FontFace, Import, Other };

  Type type{Type::Other};
  std::string text;     // rule as written, surrounding whitespace trimmed
  std::string prelude;  // selector list, media query, @import target ...
  std::string name;     // at-keyword without '@', empty for style rules
  std::string body;     // between the braces
  std::vector<std::string> selectors;  // style rules only
  std::vector<CssRule> children;       // @media only
};

class Stylesheet {
 public:
  // Forgiving parse; malformed trailing input is dropped.
  static Stylesheet Parse(const std::string& css);

  const std::vector<CssRule>& Rules() const {
    return rules_;
  }

 private:
  std::vector<CssRule> rules_;
};

// A reference found in stylesheet text.
struct CssReference {
  std::string url;  // as written, quotes stripped
  bool import{false};
};

// url(...) and @import references in source order. data: URIs and
// fragment-only references (url(#id)) are skipped.
std::vector<CssReference> FindCssReferences(const std::string& css);

// Replaces every url(...) target with `map(target)`; targets for which the
// callback returns an empty string are left as they are.
std::string RewriteCssUrls(
  const std::string& css,
  const std::function<std::string(const std::string&)>& map);

// Whether a media query list can apply to a screen at all.
// "print", "speech" and "not screen" cannot; features are not evaluated.
bool MediaAppliesToScreen(const std::string& media);

// Removes pseudo-classes and pseudo-elements (":hover", "::before",
// ":nth-child(2)"). An empty result becomes "*".
std::string StripPseudo(const std::string& selector);

// "*", "html", "body" or ":root", with nothing else.
bool IsStructuralSelector(const std::string& selector);

// Compiled selector matched against libxml2 elements, right to left.
class Selector {
 public:
  // nullopt for syntax this matcher does not understand.
  static std::optional<Selector> Parse(const std::string& text);

  bool Matches(const xmlNode* element) const;

 private:
  struct Attribute {
    enum class Op { Exists, Exact, Word, Prefix, Suffix, Substring, Dash };
    std::string name;
    std::string value;
    Op op{Op::Exists};
  };
  struct Compound {
    std::string tag;  // empty: any
    std::vector<std::string> ids;
    std::vector<std::string> classes;
    std::vector<Attribute> attributes;
  };
  enum class Combinator { Descendant, Child, Adjacent, Sibling };

  static bool CompoundMatches(const Compound& c, const xmlNode* node);
  bool MatchFrom(size_t index, const xmlNode* node) const;

  std::vector<Compound> compounds_;
  std::vector<Combinator> combinators_;  // combinators_[i] joins i and i+1
};
