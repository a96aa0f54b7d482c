#include "FlowLayout.hpp"
#include "Errors.hpp"
#include "ImageCodec.hpp"
#include "Logger.hpp"
#include "SiteFetcher.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kSkipped = {
  "head", "script", "style", "link", "meta", "noscript", "template", "title",
  "base"};

const std::unordered_set<std::string> kReplaced = {
  "img", "svg", "video", "iframe", "canvas", "embed", "object",
  "input", "button", "select", "textarea", "audio"};

const std::unordered_set<std::string> kBlock = {
  "address", "article", "aside",   "blockquote", "body",    "center",
  "dd",      "details", "dialog",  "div",        "dl",      "dt",
  "fieldset", "figcaption", "figure", "footer",  "form",    "h1",
  "h2",      "h3",      "h4",      "h5",         "h6",      "header",
  "hgroup",  "hr",      "li",      "main",       "nav",     "ol",
  "p",       "pre",     "section", "summary",    "table",   "tbody",
  "td",      "tfoot",   "th",      "thead",      "tr",      "ul",
  "caption", "menu"};

double HeadingSize(const std::string& tag, double inherited) {
  if (tag == "h1")
    return 32;
  if (tag == "h2")
    return 24;
  if (tag == "h3")
    return 19;
  if (tag == "h4")
    return 16;
  if (tag == "h5")
    return 13;
  if (tag == "h6")
    return 11;
  if (tag == "small")
    return inherited * 0.83;
  return inherited;
}

double VerticalMargin(const std::string& tag, double font) {
  if (tag.size() == 2 && tag[0] == 'h' && std::isdigit(tag[1]))
    return std::round(font * 0.67);
  if (tag == "p" || tag == "ul" || tag == "ol" || tag == "dl" ||
      tag == "blockquote" || tag == "figure" || tag == "pre")
    return 16;
  if (tag == "hr")
    return 8;
  return 0;
}

std::optional<double> ParsePx(const std::optional<std::string>& attr) {
  if (!attr.has_value() || attr->empty())
    return std::nullopt;
  char* end = nullptr;
  double v = std::strtod(attr->c_str(), &end);
  if (end == attr->c_str() || v <= 0 || *end == '%')
    return std::nullopt;
  return v;
}

bool IsHidden(const xmlNode* node) {
  static const std::regex display_none(R"(display\s*:\s*none)",
                                       std::regex::icase);
  if (HtmlDocument::HasAttr(node, "hidden"))
    return true;
  if (HtmlDocument::Name(node) == "input") {
    auto type = HtmlDocument::Attr(node, "type").value_or("");
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (type == "hidden")
      return true;
  }
  auto style = HtmlDocument::Attr(node, "style");
  return style.has_value() && std::regex_search(*style, display_none);
}

size_t CollapsedLength(const std::string& text) {
  size_t n = 0;
  bool space = true;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      if (!space)
        ++n;
      space = true;
    } else {
      ++n;
      space = false;
    }
  }
  if (n > 0 && space)
    --n;
  return n;
}

// Text of the current block being wrapped into lines.
struct Run {
  double x;
  double width;
  double top;  // y where the pending text starts
  double chars{0};
  double line_height;
  double char_width;

  double LinesHeight(double c) const {
    if (c <= 0)
      return 0;
    return std::ceil(c * char_width / std::max(width, char_width)) *
           line_height;
  }
  double CurrentY() const {
    if (chars <= 0)
      return top;
    return top + std::floor(chars * char_width / std::max(width, char_width)) *
                   line_height;
  }
  void Flush() {
    top += LinesHeight(chars);
    chars = 0;
  }
};

class Flow {
 public:
  Flow(const HtmlDocument& doc, const ResourceGraph& graph, LayoutData& data)
      : graph_{graph}, data_{data} {
    const URL url{doc.get()->URL != nullptr
                    ? reinterpret_cast<const char*>(doc.get()->URL)
                    : ""};
    base_ = SiteFetcher::DocumentBase(doc, url);
    auto elements = doc.Elements();
    for (size_t i = 0; i < elements.size(); ++i)
      index_[elements[i]] = static_cast<int>(i);
  }

  double Block(const xmlNode* node, double x, double y, double width,
               double font) {
    const std::string tag = HtmlDocument::Name(node);
    font = HeadingSize(tag, font);
    const double margin = VerticalMargin(tag, font);
    const double inset = tag == "body" ? FlowLayout::kBodyMargin : 0;

    Run run{x + inset,
            std::max(1.0, width - 2 * inset),
            y + margin + inset,
            0,
            std::round(font * 1.2),
            std::max(1.0, font / 2)};
    if (tag == "hr")
      run.top += 2;
    Children(node, run, font);
    run.Flush();

    const double height = run.top - y + margin + inset;
    Record(node, Box{x, y, width, height});
    return height;
  }

 private:
  void Children(const xmlNode* node, Run& run, double font) {
    for (const xmlNode* child = node->children; child != nullptr;
         child = child->next) {
      if (child->type == XML_TEXT_NODE) {
        if (child->content != nullptr)
          run.chars += static_cast<double>(CollapsedLength(
            reinterpret_cast<const char*>(child->content)));
        continue;
      }
      if (child->type != XML_ELEMENT_NODE)
        continue;

      const std::string tag = HtmlDocument::Name(child);
      if (kSkipped.count(tag) != 0 || IsHidden(child))
        continue;

      if (tag == "br") {
        run.Flush();
        run.top += run.line_height;
        continue;
      }
      if (kReplaced.count(tag) != 0) {
        run.Flush();
        Box box = Replaced(child, tag, run.x, run.top, run.width);
        Record(child, box);
        run.top += box.height;
        continue;
      }
      if (kBlock.count(tag) != 0) {
        run.Flush();
        run.top += Block(child, run.x, run.top, run.width, font);
        continue;
      }

      // inline element: shares the run with its parent
      const double start = run.CurrentY();
      const double inner_font = HeadingSize(tag, font);
      Children(child, run, inner_font);
      const double end = run.top + run.LinesHeight(run.chars);
      Record(child, Box{run.x, start, run.width,
                        std::max(end - start, run.line_height)});
    }
  }

  Box Replaced(const xmlNode* node, const std::string& tag, double x, double y,
               double container) {
    auto w = ParsePx(HtmlDocument::Attr(node, "width"));
    auto h = ParsePx(HtmlDocument::Attr(node, "height"));

    if (tag == "img" && (!w.has_value() || !h.has_value())) {
      if (auto info = Intrinsic(node)) {
        if (w.has_value() && info->width > 0) {
          h = *w * info->height / info->width;
        } else if (h.has_value() && info->height > 0) {
          w = *h * info->width / info->height;
        } else {
          w = info->width;
          h = info->height;
        }
      }
    }

    double dw = 300, dh = 150;
    if (tag == "input" || tag == "select" || tag == "button") {
      dw = 150;
      dh = 30;
    } else if (tag == "textarea") {
      dw = 300;
      dh = 40;
    } else if (tag == "audio") {
      dh = 54;
    }
    double width = w.value_or(dw);
    double height = h.value_or(dh);
    if (width > container && width > 0) {
      height = height * container / width;
      width = container;
    }
    return Box{x, y, width, height};
  }

  std::optional<ImageInfo> Intrinsic(const xmlNode* img) const {
    auto src = HtmlDocument::Attr(img, "src");
    if (!src.has_value() || src->empty())
      return std::nullopt;
    const Resource* res = graph_.Find(base_.Resolve(*src));
    if (res == nullptr)
      return std::nullopt;
    auto info = SniffImage(res->bytes);
    if (info.has_value() && (info->width <= 0 || info->height <= 0))
      return std::nullopt;
    return info;
  }

  void Record(const xmlNode* node, const Box& box) {
    if (auto it = index_.find(node); it != index_.end())
      data_.Set(it->second, box);
  }

  const ResourceGraph& graph_;
  LayoutData& data_;
  URL base_;
  std::unordered_map<const xmlNode*, int> index_;
};
}  // namespace

LayoutData FlowLayout::Layout(const HtmlDocument& doc,
                              const ResourceGraph& graph, const Viewport& vp) {
  xmlNodePtr body = doc.Body();
  if (body == nullptr) {
    throw NoViewportDataError("document has no <body>");
  }

  LayoutData data(vp);
  Flow flow(doc, graph, data);
  const double height = flow.Block(body, 0, 0, vp.width, kFontSize);
  if (xmlNodePtr html = doc.Html()) {
    const int index = doc.IndexOf(html);
    if (index >= 0)
      data.Set(index, Box{0, 0, static_cast<double>(vp.width), height});
  }

  // html and body alone carry no geometry worth using
  if (data.Size() <= 2) {
    throw NoViewportDataError("<body> has no rendered content");
  }
  IF_DEBUG {
    logr::debug << "[FlowLayout] " << data.Size() << " boxes, page height "
                << height << "px at " << vp.width << "x" << vp.height;
  }
  return data;
}
