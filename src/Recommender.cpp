#include "Recommender.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cstdio>

namespace {

nlohmann::json CodeChange(const char* file_type, const char* description,
                          const char* example) {
  return nlohmann::json{{"file_type", file_type},
                        {"description", description},
                        {"example", example}};
}

std::string StringField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string())
    return "";
  return it->get<std::string>();
}
}  // namespace

nlohmann::json Recommendation::ToJson() const {
  return nlohmann::json{{"issue_id", issue_id},
                        {"issue", issue},
                        {"importance", importance},
                        {"steps", steps},
                        {"code_changes", code_changes}};
}

std::vector<AuditIssue> Recommender::Issues(const nlohmann::json& report) {
  std::vector<AuditIssue> issues;
  if (!report.is_object())
    return issues;
  auto audits = report.find("audits");
  if (audits == report.end() || !audits->is_object())
    return issues;

  for (auto it = audits->begin(); it != audits->end(); ++it) {
    const auto& audit = it.value();
    if (!audit.is_object() || !audit.contains("details"))
      continue;
    auto score = audit.find("score");
    if (score == audit.end() || !score->is_number())
      continue;
    if (score->get<double>() >= kPassScore)
      continue;
    issues.push_back(AuditIssue{it.key(), StringField(audit, "title"),
                                StringField(audit, "description"),
                                score->get<double>()});
  }
  std::stable_sort(issues.begin(), issues.end(),
                   [](const AuditIssue& a, const AuditIssue& b) {
                     return a.score < b.score;
                   });
  return issues;
}

Recommendation Recommender::For(const AuditIssue& issue) {
  Recommendation rec;
  rec.issue_id = issue.id;
  rec.issue = issue.title.empty() ? issue.id : issue.title;
  rec.importance = issue.score < 0.5 ? "high" : "medium";

  const std::string& id = issue.id;
  if (id == "render-blocking-resources") {
    rec.steps = {"Add defer attribute to non-critical JavaScript",
                 "Inline critical CSS and defer non-critical CSS"};
    rec.code_changes.push_back(
      CodeChange("html", "Add defer to script tags",
                 "<script src=\"non-critical.js\" defer></script>"));
  } else if (id == "unminified-css" || id == "unminified-javascript") {
    rec.steps = {id == "unminified-css" ? "Minify CSS files"
                                        : "Minify JAVASCRIPT files",
                 "Set up build process with minification tools"};
  } else if (id == "unused-css-rules") {
    rec.steps = {"Remove unused CSS",
                 "Consider using PurgeCSS to automatically remove unused "
                 "styles"};
  } else if (id == "unused-javascript") {
    rec.steps = {"Implement code splitting", "Remove dead code"};
  } else if (id == "offscreen-images") {
    rec.steps = {"Implement lazy loading for images"};
    rec.code_changes.push_back(
      CodeChange("html", "Add loading=\"lazy\" to image tags",
                 "<img src=\"image.jpg\" loading=\"lazy\" alt=\"Description\">"));
  } else if (id == "uses-responsive-images") {
    rec.steps = {"Use responsive image syntax with srcset"};
    rec.code_changes.push_back(CodeChange(
      "html", "Implement srcset for responsive images",
      "<img srcset=\"small.jpg 300w, medium.jpg 600w, large.jpg 1200w\" "
      "sizes=\"(max-width: 320px) 280px, (max-width: 640px) 580px, 1200px\" "
      "src=\"fallback.jpg\" alt=\"Description\">"));
  } else if (id == "uses-optimized-images") {
    rec.steps = {"Compress images and use modern formats like WebP",
                 "Set up an image optimization build step"};
  } else if (id == "uses-text-compression") {
    rec.steps = {"Enable GZIP or Brotli compression on your server"};
    rec.code_changes.push_back(CodeChange(
      "server", "Apache: Enable GZIP compression",
      "<IfModule mod_deflate.c>\n"
      "  AddOutputFilterByType DEFLATE text/html text/plain text/css "
      "application/javascript\n"
      "</IfModule>"));
  } else if (id == "uses-long-cache-ttl") {
    rec.steps = {"Serve static assets with a long cache lifetime",
                 "Fingerprint asset file names so they can be immutable"};
    rec.code_changes.push_back(
      CodeChange("server", "Cache-Control for static assets",
                 "Cache-Control: public, max-age=31536000, immutable"));
  } else {
    rec.steps = {"Address " + rec.issue,
                 "Refer to Lighthouse documentation for specifics"};
  }
  return rec;
}

nlohmann::json Recommender::Estimate(double current_score,
                                     const std::vector<AuditIssue>& issues) {
  double potential = 0;
  for (const auto& issue : issues) {
    const double gap = kPassScore - issue.score;
    potential += issue.score < 0.5 ? gap * 5 : gap * 2;
  }
  potential = std::max(0.0, std::min(potential, 100.0 - current_score));

  char pct[32];
  std::snprintf(pct, sizeof(pct), "%.1f%%", potential);
  return nlohmann::json{
    {"current_score", current_score},
    {"potential_score", std::min(current_score + potential, 100.0)},
    {"percentage_improvement", pct}};
}

nlohmann::json Recommender::Report(
  const std::string& url, const MetricsDocument& metrics,
  const nlohmann::json& raw_report,
  const std::optional<std::string>& critical_css) {
  const std::vector<AuditIssue> issues =
    metrics.degraded ? std::vector<AuditIssue>{} : Issues(raw_report);

  nlohmann::json issues_j = nlohmann::json::array();
  for (const auto& i : issues) {
    issues_j.push_back({{"id", i.id},
                        {"title", i.title},
                        {"description", i.description},
                        {"score", i.score}});
  }

  std::vector<Recommendation> recs;
  for (const auto& i : issues)
    recs.push_back(For(i));

  nlohmann::json recs_j = nlohmann::json::array();
  for (const auto& r : recs)
    recs_j.push_back(r.ToJson());

  // high importance first, otherwise lowest score first
  std::vector<const Recommendation*> ordered;
  for (const auto& r : recs)
    ordered.push_back(&r);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const Recommendation* a, const Recommendation* b) {
                     return a->importance == "high" && b->importance != "high";
                   });
  nlohmann::json tasks = nlohmann::json::array();
  for (size_t i = 0; i < ordered.size(); ++i) {
    tasks.push_back({{"priority", i + 1},
                     {"task", ordered[i]->issue},
                     {"steps", ordered[i]->steps},
                     {"code_examples", ordered[i]->code_changes}});
  }

  auto has = [&](const char* id) {
    return std::any_of(issues.begin(), issues.end(),
                       [&](const AuditIssue& i) { return i.id == id; });
  };
  nlohmann::json automation = nlohmann::json::array();
  if (has("uses-optimized-images")) {
    automation.push_back(
      {{"task", "Image optimization"},
       {"automation_tool", "pagelift --optimize-and-test re-encodes PNGs"},
       {"implementation_complexity", "Medium"}});
  }
  if (has("unminified-css") || has("unminified-javascript")) {
    automation.push_back(
      {{"task", "Asset minification"},
       {"automation_tool", "Add a minification step to the build"},
       {"implementation_complexity", "Low"}});
  }

  nlohmann::json guide{
    {"summary",
     "Found " + std::to_string(recs.size()) + " issues to address"},
    {"estimated_score_improvement",
     Estimate(metrics.performance_score, issues)},
    {"prioritized_tasks", tasks},
    {"automation_opportunities", automation},
    {"critical_css", critical_css ? nlohmann::json(*critical_css)
                                  : nlohmann::json(nullptr)}};

  nlohmann::json report{
    {"url", url},
    {"analysis",
     {{"performance_score", metrics.performance_score},
      {"key_metrics", metrics.ToJson()},
      {"critical_issues", issues_j}}},
    {"recommendations", recs_j},
    {"implementation_guide", guide}};
  if (metrics.degraded)
    report["analysis"]["diagnostic"] = metrics.diagnostic;

  logr::info << "[Recommender] " << recs.size() << " issue(s); potential "
             << guide["estimated_score_improvement"]["percentage_improvement"]
                  .get<std::string>();
  return report;
}
