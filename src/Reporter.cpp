#include "Reporter.hpp"
#include "Logger.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

struct MetricSpec {
  const char* metric;
  const char* label;
  bool higher_is_better;
  double MetricsDocument::*field;
  int precision;
  // set instead of `field` for metrics an analyzer may omit
  std::optional<double> MetricsDocument::*optional_field;

  std::optional<double> ValueIn(const MetricsDocument& m) const {
    if (optional_field != nullptr)
      return m.*optional_field;
    return m.*field;
  }
};

const MetricSpec kMetrics[] = {
  {"performance_score", "Performance Score", true,
   &MetricsDocument::performance_score, 0, nullptr},
  {"largest_contentful_paint_ms", "Largest Contentful Paint (ms)", false,
   &MetricsDocument::largest_contentful_paint_ms, 0, nullptr},
  {"cumulative_layout_shift", "Cumulative Layout Shift", false,
   &MetricsDocument::cumulative_layout_shift, 3, nullptr},
  {"total_blocking_time_ms", "Total Blocking Time (ms)", false,
   &MetricsDocument::total_blocking_time_ms, 0, nullptr},
  {"time_to_interactive_ms", "Time to Interactive (ms)", false,
   &MetricsDocument::time_to_interactive_ms, 0, nullptr},
  {"first_contentful_paint_ms", "First Contentful Paint (ms)", false, nullptr,
   0, &MetricsDocument::first_contentful_paint_ms},
};

int PrecisionOf(const std::string& metric) {
  for (const auto& row : kMetrics) {
    if (metric == row.metric)
      return row.precision;
  }
  return 1;
}

std::string Format(double v, int precision, bool sign = false) {
  std::ostringstream os;
  if (sign && v > 0)
    os << '+';
  os << std::fixed << std::setprecision(precision) << v;
  return os.str();
}

std::string Side(const MetricsDocument& m, const std::optional<double>& value,
                 int precision) {
  if (m.degraded)
    return "synthetic";
  if (!value)
    return "n/a";
  return Format(*value, precision);
}

std::string EscapeHtml(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string EscapeCell(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '|')
      out += "\\|";
    else if (c == '\n')
      out += ' ';
    else
      out += c;
  }
  return out;
}

std::string SideLabel(const char* name, const MetricsDocument& m) {
  std::string out = std::string{name} + ": " + m.source;
  if (m.degraded)
    out += " (synthetic placeholder: " + m.diagnostic + ")";
  return out;
}
}  // namespace

std::string MetricDelta::Verdict() const {
  if (!delta.has_value())
    return "n/a";
  if (std::fabs(*delta) < 1e-9)
    return "unchanged";
  const bool better = higher_is_better ? *delta > 0 : *delta < 0;
  return better ? "improved" : "regressed";
}

nlohmann::json ComparisonReport::ToJson() const {
  nlohmann::json deltas_j = nlohmann::json::object();
  for (const auto& d : deltas) {
    deltas_j[d.metric] = d.delta.has_value() ? nlohmann::json(*d.delta)
                                             : nlohmann::json(nullptr);
  }
  nlohmann::json actions_j = nlohmann::json::array();
  for (const auto& a : actions)
    actions_j.push_back(a.ToJson());

  return nlohmann::json{{"url", url},
                        {"sign_convention", ComparisonReporter::kSignConvention},
                        {"original_metrics", original.ToJson()},
                        {"optimized_metrics", optimized.ToJson()},
                        {"per_metric_delta", deltas_j},
                        {"actions_applied", actions_applied},
                        {"actions", actions_j},
                        {"partial", partial},
                        {"notes", notes}};
}

ComparisonReport ComparisonReporter::Build(
  const std::string& url, const MetricsDocument& original,
  const MetricsDocument& optimized,
  const std::vector<OptimizationAction>& actions, bool partial,
  std::vector<std::string> notes) {
  ComparisonReport report;
  report.url = url;
  report.original = original;
  report.optimized = optimized;
  report.actions = actions;
  report.partial = partial;
  report.notes = std::move(notes);

  for (const auto& a : actions) {
    if (a.applied)
      ++report.actions_applied;
  }

  const bool comparable = !original.degraded && !optimized.degraded;
  for (const auto& row : kMetrics) {
    MetricDelta d;
    d.metric = row.metric;
    d.label = row.label;
    d.higher_is_better = row.higher_is_better;
    d.original = row.ValueIn(original);
    d.optimized = row.ValueIn(optimized);
    if (comparable && d.original && d.optimized)
      d.delta = *d.optimized - *d.original;
    report.deltas.push_back(std::move(d));
  }

  if (original.degraded)
    report.notes.push_back("original audit is synthetic: " +
                           original.diagnostic);
  if (optimized.degraded)
    report.notes.push_back("optimized audit is synthetic: " +
                           optimized.diagnostic);

  logr::debug << "[Reporter] " << report.deltas.size() << " metric(s), "
              << report.actions_applied << " action(s) applied";
  return report;
}

std::string ComparisonReporter::Markdown(const ComparisonReport& report) {
  std::ostringstream md;
  md << "# Performance comparison: " << report.url << "\n\n";
  md << "- " << SideLabel("Original", report.original) << "\n";
  md << "- " << SideLabel("Optimized", report.optimized) << "\n";
  if (report.partial)
    md << "- **Partial run**: some resources or stages did not complete\n";
  md << "\n> " << kSignConvention << "\n\n";

  md << "| Metric | Original | Optimized | Delta | Verdict |\n";
  md << "|---|---:|---:|---:|---|\n";
  for (const auto& d : report.deltas) {
    const int p = PrecisionOf(d.metric);
    md << "| " << d.label << " | " << Side(report.original, d.original, p)
       << " | " << Side(report.optimized, d.optimized, p) << " | "
       << (d.delta ? Format(*d.delta, p, true) : std::string{"n/a"}) << " | "
       << d.Verdict() << " |\n";
  }

  md << "\n## Optimization actions (" << report.actions_applied << " of "
     << report.actions.size() << " applied)\n\n";
  if (report.actions.empty()) {
    md << "None.\n";
  } else {
    md << "| Kind | Target | Applied | Before | After | Note |\n";
    md << "|---|---|---|---|---|---|\n";
    for (const auto& a : report.actions) {
      md << "| " << ActionKindName(a.kind) << " | "
         << EscapeCell(a.target.ToString()) << " | "
         << (a.applied ? "yes" : "no") << " | " << EscapeCell(a.before)
         << " | " << EscapeCell(a.after) << " | " << EscapeCell(a.note)
         << " |\n";
    }
  }

  if (!report.notes.empty()) {
    md << "\n## Notes\n\n";
    for (const auto& n : report.notes)
      md << "- " << n << "\n";
  }
  return md.str();
}

std::string ComparisonReporter::Html(const ComparisonReport& report) {
  std::ostringstream h;
  h << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
    << "<title>Performance comparison: " << EscapeHtml(report.url)
    << "</title>\n<style>\n"
    << "body{font-family:sans-serif;margin:2em}"
    << "table{border-collapse:collapse}"
    << "td,th{border:1px solid #ccc;padding:4px 8px}"
    << ".improved{color:#080}.regressed{color:#b00}.synthetic{color:#888}\n"
    << "</style>\n</head>\n<body>\n";
  h << "<h1>Performance comparison: " << EscapeHtml(report.url) << "</h1>\n";
  h << "<ul>\n<li>" << EscapeHtml(SideLabel("Original", report.original))
    << "</li>\n<li>" << EscapeHtml(SideLabel("Optimized", report.optimized))
    << "</li>\n";
  if (report.partial)
    h << "<li><strong>Partial run</strong>: some resources or stages did not "
         "complete</li>\n";
  h << "</ul>\n<p class=\"sign\">" << EscapeHtml(kSignConvention) << "</p>\n";

  h << "<table>\n<tr><th>Metric</th><th>Original</th><th>Optimized</th>"
       "<th>Delta</th><th>Verdict</th></tr>\n";
  for (const auto& d : report.deltas) {
    const int p = PrecisionOf(d.metric);
    const std::string verdict = d.Verdict();
    h << "<tr><td>" << EscapeHtml(d.label) << "</td><td"
      << (report.original.degraded ? " class=\"synthetic\"" : "") << ">"
      << Side(report.original, d.original, p) << "</td><td"
      << (report.optimized.degraded ? " class=\"synthetic\"" : "") << ">"
      << Side(report.optimized, d.optimized, p) << "</td><td>"
      << (d.delta ? Format(*d.delta, p, true) : std::string{"n/a"})
      << "</td><td class=\"" << verdict << "\">" << verdict << "</td></tr>\n";
  }
  h << "</table>\n";

  h << "<h2>Optimization actions (" << report.actions_applied << " of "
    << report.actions.size() << " applied)</h2>\n";
  h << "<table>\n<tr><th>Kind</th><th>Target</th><th>Applied</th>"
       "<th>Before</th><th>After</th><th>Note</th></tr>\n";
  for (const auto& a : report.actions) {
    h << "<tr><td>" << ActionKindName(a.kind) << "</td><td>"
      << EscapeHtml(a.target.ToString()) << "</td><td>"
      << (a.applied ? "yes" : "no") << "</td><td>" << EscapeHtml(a.before)
      << "</td><td>" << EscapeHtml(a.after) << "</td><td>"
      << EscapeHtml(a.note) << "</td></tr>\n";
  }
  h << "</table>\n";

  if (!report.notes.empty()) {
    h << "<h2>Notes</h2>\n<ul>\n";
    for (const auto& n : report.notes)
      h << "<li>" << EscapeHtml(n) << "</li>\n";
    h << "</ul>\n";
  }
  h << "</body>\n</html>\n";
  return h.str();
}

std::string ComparisonReporter::Json(const ComparisonReport& report) {
  return report.ToJson().dump(2);
}
