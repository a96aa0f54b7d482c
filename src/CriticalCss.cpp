#include "CriticalCss.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "SiteFetcher.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace {

bool InsideNoscript(const xmlNode* node) {
  for (const xmlNode* p = node->parent; p != nullptr; p = p->parent) {
    if (p->type == XML_ELEMENT_NODE && HtmlDocument::Name(p) == "noscript")
      return true;
  }
  return false;
}

bool IsStylesheetLink(const xmlNode* node) {
  auto rel = HtmlDocument::Attr(node, "rel").value_or("");
  std::transform(rel.begin(), rel.end(), rel.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  std::istringstream in(rel);
  std::string token;
  while (in >> token) {
    if (token == "stylesheet")
      return true;
  }
  return false;
}

std::string TrimCopy(const std::string& s) {
  const char* ws = " \t\r\n\f";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  return s.substr(b, s.find_last_not_of(ws) - b + 1);
}
}  // namespace

std::string CriticalCssSet::Text() const {
  std::string out;
  for (const auto& r : rules) {
    out += r;
    out += '\n';
  }
  return out;
}

CriticalCssExtractor::CriticalCssExtractor(SiteHints hints)
    : hints_{std::move(hints)} {
}

CriticalCssSet CriticalCssExtractor::Extract(const ResourceGraph& graph,
                                             const HtmlDocument& doc,
                                             LayoutProvider& provider,
                                             const Viewport& vp) const {
  try {
    LayoutData layout = provider.Layout(doc, graph, vp);
    return Extract(graph, doc, &layout);
  } catch (const NoViewportDataError& e) {
    CriticalCssSet set = Extract(graph, doc, nullptr);
    set.warning = e.what();
    return set;
  }
}

CriticalCssSet CriticalCssExtractor::Extract(const ResourceGraph& graph,
                                             const HtmlDocument& doc,
                                             const LayoutData* layout) const {
  CriticalCssSet set;
  if (layout == nullptr || layout->Empty()) {
    set.has_viewport_data = false;
    set.warning = "no viewport data; critical CSS left empty";
    logr::warning << "[CriticalCss] " << *set.warning;
    return set;
  }

  std::vector<const xmlNode*> visible;
  auto elements = doc.Elements();
  for (size_t i = 0; i < elements.size(); ++i) {
    if (layout->InViewport(static_cast<int>(i)))
      visible.push_back(elements[i]);
  }
  logr::debug << "[CriticalCss] " << visible.size() << " of "
              << elements.size() << " elements in the first viewport";

  std::unordered_set<std::string> seen;
  for (const auto& sheet : CollectSheets(graph, doc)) {
    const Stylesheet parsed = Stylesheet::Parse(sheet.css);
    size_t kept = 0;
    for (const auto& rule : parsed.Rules()) {
      auto text = Filter(rule, sheet.base, visible);
      if (!text.has_value())
        continue;
      if (seen.insert(*text).second) {
        set.rules.push_back(std::move(*text));
        ++kept;
      }
    }
    logr::debug << "[CriticalCss] " << sheet.label << ": kept " << kept
                << " of " << parsed.Rules().size() << " rule(s)";
  }
  logr::info << "[CriticalCss] " << set.rules.size() << " critical rule(s)";
  return set;
}

std::vector<CriticalCssExtractor::Sheet> CriticalCssExtractor::CollectSheets(
  const ResourceGraph& graph, const HtmlDocument& doc) const {
  std::vector<Sheet> sheets;
  const URL base = SiteFetcher::DocumentBase(doc, graph.Root().url);

  for (xmlNodePtr node : doc.Elements()) {
    const std::string tag = HtmlDocument::Name(node);
    if (tag != "link" && tag != "style")
      continue;
    if (InsideNoscript(node))
      continue;
    auto media = HtmlDocument::Attr(node, "media").value_or("");
    if (!MediaAppliesToScreen(media))
      continue;

    if (tag == "style") {
      sheets.push_back(Sheet{HtmlDocument::Text(node), base, "<style>"});
      continue;
    }
    if (!IsStylesheetLink(node))
      continue;
    auto href = HtmlDocument::Attr(node, "href");
    if (!href.has_value())
      continue;
    const URL url = base.Resolve(TrimCopy(*href)).Canonical();
    const Resource* css = graph.Find(url);
    if (css == nullptr) {
      logr::debug << "[CriticalCss] stylesheet not available: " << url;
      continue;
    }
    sheets.push_back(Sheet{css->bytes, css->url, css->url.ToString()});
  }
  return sheets;
}

bool CriticalCssExtractor::IsCritical(
  const CssRule& rule, const std::vector<const xmlNode*>& visible) const {
  for (const auto& selector : rule.selectors) {
    if (IsStructuralSelector(selector))
      return true;
    const std::string stripped = StripPseudo(selector);
    for (const auto& hint : hints_.critical_selectors) {
      if (TrimCopy(hint) == selector || TrimCopy(hint) == stripped)
        return true;
    }
    auto compiled = Selector::Parse(stripped);
    if (!compiled.has_value())
      continue;
    for (const xmlNode* node : visible) {
      if (compiled->Matches(node))
        return true;
    }
  }
  return false;
}

std::optional<std::string> CriticalCssExtractor::Filter(
  const CssRule& rule, const URL& base,
  const std::vector<const xmlNode*>& visible) const {
  auto absolute = [&base](const std::string& text) {
    return RewriteCssUrls(text, [&base](const std::string& target) {
      return base.Resolve(target).ToString();
    });
  };

  switch (rule.type) {
    case CssRule::Type::FontFace:
      return absolute(rule.text);
    case CssRule::Type::Style:
      if (IsCritical(rule, visible))
        return absolute(rule.text);
      return std::nullopt;
    case CssRule::Type::Media: {
      if (!MediaAppliesToScreen(rule.prelude))
        return std::nullopt;
      std::vector<std::string> inner;
      for (const auto& child : rule.children) {
        if (auto text = Filter(child, base, visible))
          inner.push_back(std::move(*text));
      }
      if (inner.empty())
        return std::nullopt;
      std::string out = "@media " + rule.prelude + " {\n";
      for (const auto& text : inner)
        out += text + "\n";
      out += "}";
      return out;
    }
    case CssRule::Type::Import:
    case CssRule::Type::Other:
      break;
  }
  return std::nullopt;
}
