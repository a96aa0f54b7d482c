#include "CssParser.hpp"
#include "HtmlDocument.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

constexpr size_t npos = std::string::npos;

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsIdentChar(char c) {
  auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || c == '-' || c == '_' || u >= 0x80;
}

std::string Trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && IsSpace(s[b]))
    ++b;
  while (e > b && IsSpace(s[e - 1]))
    --e;
  return s.substr(b, e - b);
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Skips a quoted string starting at `pos`; returns the index past its end.
size_t SkipString(const std::string& s, size_t pos, size_t end) {
  const char quote = s[pos++];
  while (pos < end && s[pos] != quote) {
    if (s[pos] == '\\')
      ++pos;
    ++pos;
  }
  return std::min(pos + 1, end);
}

// Skips a comment starting at `pos`; returns the index past "*/".
size_t SkipComment(const std::string& s, size_t pos, size_t end) {
  size_t close = s.find("*/", pos + 2);
  return close == npos || close + 2 > end ? end : close + 2;
}

bool AtComment(const std::string& s, size_t pos, size_t end) {
  return pos + 1 < end && s[pos] == '/' && s[pos + 1] == '*';
}

std::string StripComments(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    if (s[i] == '"' || s[i] == '\'') {
      size_t next = SkipString(s, i, s.size());
      out.append(s, i, next - i);
      i = next;
    } else if (AtComment(s, i, s.size())) {
      i = SkipComment(s, i, s.size());
    } else {
      out.push_back(s[i++]);
    }
  }
  return out;
}

size_t SkipSpaceAndComments(const std::string& s, size_t pos, size_t end) {
  while (pos < end) {
    if (IsSpace(s[pos]))
      ++pos;
    else if (AtComment(s, pos, end))
      pos = SkipComment(s, pos, end);
    else if (s.compare(pos, 4, "<!--") == 0)
      pos += 4;
    else if (s.compare(pos, 3, "-->") == 0)
      pos += 3;
    else
      break;
  }
  return pos;
}

// First of `stops` outside strings, comments and parentheses.
size_t FindTopLevel(const std::string& s, size_t pos, size_t end,
                    const char* stops) {
  int depth = 0;
  while (pos < end) {
    char c = s[pos];
    if (c == '"' || c == '\'') {
      pos = SkipString(s, pos, end);
      continue;
    }
    if (AtComment(s, pos, end)) {
      pos = SkipComment(s, pos, end);
      continue;
    }
    if (c == '(' || c == '[')
      ++depth;
    else if ((c == ')' || c == ']') && depth > 0)
      --depth;
    else if (depth == 0 && std::strchr(stops, c) != nullptr)
      return pos;
    ++pos;
  }
  return npos;
}

// Index of the '}' closing the '{' at `open`.
size_t FindClose(const std::string& s, size_t open, size_t end) {
  int depth = 0;
  size_t pos = open;
  while (pos < end) {
    char c = s[pos];
    if (c == '"' || c == '\'') {
      pos = SkipString(s, pos, end);
      continue;
    }
    if (AtComment(s, pos, end)) {
      pos = SkipComment(s, pos, end);
      continue;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (--depth == 0)
        return pos;
    }
    ++pos;
  }
  return npos;
}

std::vector<std::string> SplitSelectors(const std::string& prelude) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= prelude.size()) {
    size_t comma = FindTopLevel(prelude, pos, prelude.size(), ",");
    size_t stop = comma == npos ? prelude.size() : comma;
    std::string sel = Trim(prelude.substr(pos, stop - pos));
    if (!sel.empty())
      out.push_back(sel);
    if (comma == npos)
      break;
    pos = comma + 1;
  }
  return out;
}

std::vector<CssRule> ParseBlock(const std::string& s, size_t pos,
                                size_t end) {
  std::vector<CssRule> rules;
  while (true) {
    pos = SkipSpaceAndComments(s, pos, end);
    if (pos >= end)
      break;
    if (s[pos] == '}' || s[pos] == ';') {
      ++pos;
      continue;
    }

    const size_t start = pos;
    const size_t stop = FindTopLevel(s, pos, end, "{;");
    CssRule rule;

    if (s[start] == '@') {
      size_t name_end = start + 1;
      while (name_end < end && IsIdentChar(s[name_end]))
        ++name_end;
      rule.name = Lower(s.substr(start + 1, name_end - start - 1));

      if (stop == npos || s[stop] == ';') {
        const size_t last = stop == npos ? end : stop;
        rule.type = rule.name == "import" ? CssRule::Type::Import
                                          : CssRule::Type::Other;
        rule.prelude = Trim(StripComments(s.substr(name_end, last - name_end)));
        rule.text = Trim(s.substr(start, (stop == npos ? end : stop + 1) - start));
        rules.push_back(std::move(rule));
        pos = stop == npos ? end : stop + 1;
        continue;
      }

      const size_t close = FindClose(s, stop, end);
      const bool truncated = close == npos;
      const size_t body_end = truncated ? end : close;
      rule.prelude = Trim(StripComments(s.substr(name_end, stop - name_end)));
      rule.body = s.substr(stop + 1, body_end - stop - 1);
      rule.text = Trim(s.substr(start, (truncated ? end : close + 1) - start));
      if (truncated)
        rule.text += "}";
      if (rule.name == "media") {
        rule.type = CssRule::Type::Media;
        rule.children = ParseBlock(s, stop + 1, body_end);
      } else if (rule.name == "font-face") {
        rule.type = CssRule::Type::FontFace;
      } else {
        rule.type = CssRule::Type::Other;
      }
      rules.push_back(std::move(rule));
      pos = truncated ? end : close + 1;
      continue;
    }

    if (stop == npos || s[stop] == ';') {
      // stray declaration outside any rule
      pos = stop == npos ? end : stop + 1;
      continue;
    }
    const size_t close = FindClose(s, stop, end);
    if (close == npos)
      break;
    rule.type = CssRule::Type::Style;
    rule.prelude = Trim(StripComments(s.substr(start, stop - start)));
    rule.body = s.substr(stop + 1, close - stop - 1);
    rule.text = Trim(s.substr(start, close + 1 - start));
    rule.selectors = SplitSelectors(rule.prelude);
    rules.push_back(std::move(rule));
    pos = close + 1;
  }
  return rules;
}

bool Skippable(const std::string& url) {
  if (url.empty() || url[0] == '#')
    return true;
  return Lower(url.substr(0, 5)) == "data:";
}

std::string ParseIdent(const std::string& s, size_t& i) {
  size_t start = i;
  while (i < s.size() && IsIdentChar(s[i]))
    ++i;
  return s.substr(start, i - start);
}

bool StartsWithNoCase(const std::string& s, size_t pos, const char* word) {
  const size_t n = std::strlen(word);
  if (pos + n > s.size())
    return false;
  for (size_t k = 0; k < n; ++k) {
    if (std::tolower(static_cast<unsigned char>(s[pos + k])) != word[k])
      return false;
  }
  return true;
}

// A url(...) or @import "..." target located in stylesheet text.
struct UrlToken {
  size_t begin{0};  // at "url(" or at the opening quote
  size_t end{0};    // past ")" or the closing quote
  char quote{'\0'};
  std::string target;
  bool import{false};
  bool function{false};  // url(...) form
};

// `pos` is at "url(". Quoted targets end at their closing quote, unquoted
// ones at the first ')'.
bool ParseUrlFunction(const std::string& s, size_t pos, UrlToken& tok) {
  size_t i = pos + 4;
  while (i < s.size() && IsSpace(s[i]))
    ++i;
  if (i >= s.size())
    return false;

  size_t close;
  if (s[i] == '"' || s[i] == '\'') {
    const size_t after = SkipString(s, i, s.size());
    if (after - 1 == i || s[after - 1] != s[i])
      return false;
    tok.quote = s[i];
    tok.target = Trim(s.substr(i + 1, after - i - 2));
    close = after;
    while (close < s.size() && IsSpace(s[close]))
      ++close;
    if (close >= s.size() || s[close] != ')')
      return false;
  } else {
    close = s.find(')', i);
    if (close == npos)
      return false;
    tok.quote = '\0';
    tok.target = Trim(s.substr(i, close - i));
  }
  tok.begin = pos;
  tok.end = close + 1;
  tok.function = true;
  return true;
}

// Single forward pass over `s` calling `emit` for each url() and @import
// target. Strings and comments are stepped over.
template <typename Emit>
void ScanUrls(const std::string& s, Emit emit) {
  size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '"' || c == '\'') {
      i = SkipString(s, i, s.size());
    } else if (AtComment(s, i, s.size())) {
      i = SkipComment(s, i, s.size());
    } else if (c == '@' && StartsWithNoCase(s, i + 1, "import") &&
               (i + 7 >= s.size() || !IsIdentChar(s[i + 7]))) {
      UrlToken tok;
      const size_t j = SkipSpaceAndComments(s, i + 7, s.size());
      if (j < s.size() && (s[j] == '"' || s[j] == '\'')) {
        const size_t after = SkipString(s, j, s.size());
        if (after - 1 > j && s[after - 1] == s[j]) {
          tok.begin = j;
          tok.end = after;
          tok.quote = s[j];
          tok.target = Trim(s.substr(j + 1, after - j - 2));
          tok.import = true;
          emit(tok);
        }
        i = after;
      } else if (StartsWithNoCase(s, j, "url(") && ParseUrlFunction(s, j, tok)) {
        tok.import = true;
        emit(tok);
        i = tok.end;
      } else {
        i += 7;
      }
    } else if ((c == 'u' || c == 'U') && StartsWithNoCase(s, i, "url(") &&
               (i == 0 || !IsIdentChar(s[i - 1]))) {
      UrlToken tok;
      if (ParseUrlFunction(s, i, tok)) {
        emit(tok);
        i = tok.end;
      } else {
        i += 4;
      }
    } else {
      ++i;
    }
  }
}
}  // namespace

Stylesheet Stylesheet::Parse(const std::string& css) {
  Stylesheet sheet;
  sheet.rules_ = ParseBlock(css, 0, css.size());
  return sheet;
}

std::vector<CssReference> FindCssReferences(const std::string& css) {
  std::vector<CssReference> out;
  ScanUrls(css, [&](const UrlToken& tok) {
    if (!Skippable(tok.target))
      out.push_back(CssReference{tok.target, tok.import});
  });
  return out;
}

std::string RewriteCssUrls(
  const std::string& css,
  const std::function<std::string(const std::string&)>& map) {
  std::string out;
  out.reserve(css.size());
  size_t tail = 0;
  ScanUrls(css, [&](const UrlToken& tok) {
    if (!tok.function || Skippable(tok.target))
      return;
    const std::string replaced = map(tok.target);
    if (replaced.empty())
      return;
    out.append(css, tail, tok.begin - tail);
    const std::string q = tok.quote == '\0' ? "" : std::string(1, tok.quote);
    out += "url(" + q + replaced + q + ")";
    tail = tok.end;
  });
  out.append(css, tail, npos);
  return out;
}

bool MediaAppliesToScreen(const std::string& media) {
  const std::string list = Lower(Trim(media));
  if (list.empty())
    return true;
  for (const auto& raw : SplitSelectors(list)) {
    std::string q = raw;
    bool negate = false;
    if (q.rfind("only ", 0) == 0) {
      q = Trim(q.substr(5));
    } else if (q.rfind("not ", 0) == 0) {
      negate = true;
      q = Trim(q.substr(4));
    }
    std::string type = "all";
    if (!q.empty() && q[0] != '(') {
      size_t i = 0;
      type = ParseIdent(q, i);
    }
    const bool has_features = q.find('(') != npos;
    const bool screenish = type == "all" || type == "screen";
    if (negate ? (!screenish || has_features) : screenish)
      return true;
  }
  return false;
}

std::string StripPseudo(const std::string& selector) {
  std::string out;
  size_t i = 0;
  const size_t n = selector.size();
  while (i < n) {
    char c = selector[i];
    if (c == '"' || c == '\'') {
      size_t next = SkipString(selector, i, n);
      out.append(selector, i, next - i);
      i = next;
      continue;
    }
    if (c == '[') {
      size_t close = FindTopLevel(selector, i + 1, n, "]");
      size_t next = close == npos ? n : close + 1;
      out.append(selector, i, next - i);
      i = next;
      continue;
    }
    if (c != ':') {
      out.push_back(c);
      ++i;
      continue;
    }
    // pseudo starting a compound keeps the compound alive as '*'
    if (out.empty() || IsSpace(out.back()) ||
        std::strchr(">+~", out.back()) != nullptr)
      out.push_back('*');
    while (i < n && selector[i] == ':')
      ++i;
    ParseIdent(selector, i);
    if (i < n && selector[i] == '(') {
      int depth = 0;
      while (i < n) {
        if (selector[i] == '(')
          ++depth;
        else if (selector[i] == ')' && --depth == 0) {
          ++i;
          break;
        }
        ++i;
      }
    }
  }
  std::string trimmed = Trim(out);
  return trimmed.empty() ? "*" : trimmed;
}

bool IsStructuralSelector(const std::string& selector) {
  const std::string s = Lower(Trim(selector));
  return s == "*" || s == "html" || s == "body" || s == ":root";
}

std::optional<Selector> Selector::Parse(const std::string& text) {
  Selector sel;
  const std::string s = Trim(text);
  size_t i = 0;
  const size_t n = s.size();
  if (n == 0)
    return std::nullopt;

  while (true) {
    Compound c;
    bool any = false;
    if (i < n && s[i] == '*') {
      ++i;
      any = true;
    } else if (i < n && IsIdentChar(s[i])) {
      c.tag = Lower(ParseIdent(s, i));
      any = true;
    }
    while (i < n) {
      if (s[i] == '#' || s[i] == '.') {
        const char kind = s[i++];
        std::string ident = ParseIdent(s, i);
        if (ident.empty())
          return std::nullopt;
        (kind == '#' ? c.ids : c.classes).push_back(ident);
        any = true;
      } else if (s[i] == '[') {
        ++i;
        while (i < n && IsSpace(s[i]))
          ++i;
        Attribute attr;
        attr.name = Lower(ParseIdent(s, i));
        if (attr.name.empty())
          return std::nullopt;
        while (i < n && IsSpace(s[i]))
          ++i;
        if (i < n && s[i] != ']') {
          const char op = s[i];
          if (op == '=') {
            attr.op = Attribute::Op::Exact;
            ++i;
          } else if (i + 1 < n && s[i + 1] == '=') {
            switch (op) {
              case '~':
                attr.op = Attribute::Op::Word;
                break;
              case '^':
                attr.op = Attribute::Op::Prefix;
                break;
              case '$':
                attr.op = Attribute::Op::Suffix;
                break;
              case '*':
                attr.op = Attribute::Op::Substring;
                break;
              case '|':
                attr.op = Attribute::Op::Dash;
                break;
              default:
                return std::nullopt;
            }
            i += 2;
          } else {
            return std::nullopt;
          }
          while (i < n && IsSpace(s[i]))
            ++i;
          if (i < n && (s[i] == '"' || s[i] == '\'')) {
            size_t next = SkipString(s, i, n);
            attr.value = s.substr(i + 1, next - i - 2);
            i = next;
          } else {
            size_t start = i;
            while (i < n && s[i] != ']' && !IsSpace(s[i]))
              ++i;
            attr.value = s.substr(start, i - start);
          }
          // optional case flag, ignored
          while (i < n && s[i] != ']')
            ++i;
        }
        if (i >= n || s[i] != ']')
          return std::nullopt;
        ++i;
        c.attributes.push_back(std::move(attr));
        any = true;
      } else {
        break;
      }
    }
    if (!any)
      return std::nullopt;
    sel.compounds_.push_back(std::move(c));

    bool space = false;
    while (i < n && IsSpace(s[i])) {
      ++i;
      space = true;
    }
    if (i >= n)
      break;
    if (s[i] == '>' || s[i] == '+' || s[i] == '~') {
      sel.combinators_.push_back(s[i] == '>'   ? Combinator::Child
                                 : s[i] == '+' ? Combinator::Adjacent
                                               : Combinator::Sibling);
      ++i;
      while (i < n && IsSpace(s[i]))
        ++i;
    } else if (space) {
      sel.combinators_.push_back(Combinator::Descendant);
    } else {
      // pseudo-classes, namespaces, anything else
      return std::nullopt;
    }
  }
  return sel;
}

bool Selector::Matches(const xmlNode* element) const {
  if (!HtmlDocument::IsElement(element) || compounds_.empty())
    return false;
  return MatchFrom(compounds_.size() - 1, element);
}

bool Selector::CompoundMatches(const Compound& c, const xmlNode* node) {
  if (!c.tag.empty() && HtmlDocument::Name(node) != c.tag)
    return false;
  for (const auto& id : c.ids) {
    if (HtmlDocument::Attr(node, "id") != id)
      return false;
  }
  if (!c.classes.empty()) {
    auto have = HtmlDocument::Classes(node);
    for (const auto& cls : c.classes) {
      if (std::find(have.begin(), have.end(), cls) == have.end())
        return false;
    }
  }
  for (const auto& attr : c.attributes) {
    auto value = HtmlDocument::Attr(node, attr.name.c_str());
    if (!value.has_value())
      return false;
    const std::string& v = *value;
    const std::string& want = attr.value;
    switch (attr.op) {
      case Attribute::Op::Exists:
        break;
      case Attribute::Op::Exact:
        if (v != want)
          return false;
        break;
      case Attribute::Op::Word: {
        bool found = false;
        size_t pos = 0;
        while (pos <= v.size() && !found) {
          size_t sp = v.find(' ', pos);
          found = v.substr(pos, sp == npos ? npos : sp - pos) == want;
          if (sp == npos)
            break;
          pos = sp + 1;
        }
        if (!found)
          return false;
        break;
      }
      case Attribute::Op::Prefix:
        if (want.empty() || v.compare(0, want.size(), want) != 0)
          return false;
        break;
      case Attribute::Op::Suffix:
        if (want.empty() || v.size() < want.size() ||
            v.compare(v.size() - want.size(), want.size(), want) != 0)
          return false;
        break;
      case Attribute::Op::Substring:
        if (want.empty() || v.find(want) == npos)
          return false;
        break;
      case Attribute::Op::Dash:
        if (v != want && v.rfind(want + "-", 0) != 0)
          return false;
        break;
    }
  }
  return true;
}

bool Selector::MatchFrom(size_t index, const xmlNode* node) const {
  if (!CompoundMatches(compounds_[index], node))
    return false;
  if (index == 0)
    return true;

  auto prev_element = [](const xmlNode* n) {
    const xmlNode* p = n->prev;
    while (p != nullptr && p->type != XML_ELEMENT_NODE)
      p = p->prev;
    return p;
  };

  switch (combinators_[index - 1]) {
    case Combinator::Descendant:
      for (const xmlNode* a = node->parent; HtmlDocument::IsElement(a);
           a = a->parent) {
        if (MatchFrom(index - 1, a))
          return true;
      }
      return false;
    case Combinator::Child:
      return HtmlDocument::IsElement(node->parent) &&
             MatchFrom(index - 1, node->parent);
    case Combinator::Adjacent: {
      const xmlNode* p = prev_element(node);
      return p != nullptr && MatchFrom(index - 1, p);
    }
    case Combinator::Sibling:
      for (const xmlNode* p = prev_element(node); p != nullptr;
           p = prev_element(p)) {
        if (MatchFrom(index - 1, p))
          return true;
      }
      return false;
  }
  return false;
}
