#include "Pipeline.hpp"
#include "ArtifactWriter.hpp"
#include "DocumentRewriter.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Optimizer.hpp"
#include "Recommender.hpp"
#include "SiteFetcher.hpp"

namespace {

nlohmann::json UnresolvedRefs(const ResourceGraph& graph) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& ref : graph.Refs()) {
    if (ref.resolved)
      continue;
    out.push_back({{"url", ref.url.ToString()},
                   {"origin", OriginName(ref.origin)},
                   {"referrer", ref.referrer.ToString()},
                   {"timed_out", ref.timed_out},
                   {"error", ref.error}});
  }
  return out;
}

nlohmann::json ActionsJson(const std::vector<OptimizationAction>& actions) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& a : actions)
    out.push_back(a.ToJson());
  return out;
}

nlohmann::json PathList(const std::vector<std::filesystem::path>& paths) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& p : paths)
    out.push_back(p.generic_string());
  return out;
}

void SaveOrWarn(ArtifactWriter& writer, const std::filesystem::path& relative,
                const std::string& data) {
  if (!writer.Save(relative, data))
    logr::warning << "[Pipeline] " << relative << " not written";
}

void SaveOrWarn(ArtifactWriter& writer, const std::filesystem::path& relative,
                const nlohmann::json& data) {
  if (!writer.Save(relative, data))
    logr::warning << "[Pipeline] " << relative << " not written";
}
}  // namespace

Pipeline::Pipeline(const RunConfig& conf, HttpTransport& transport,
                   Analyzer& analyzer, LayoutProvider& layout,
                   const std::atomic<bool>* cancelled)
    : conf_{conf},
      transport_{transport},
      analyzer_{analyzer},
      layout_{layout},
      cancelled_{cancelled} {
}

bool Pipeline::Cancelled() const {
  return cancelled_ != nullptr && cancelled_->load();
}

bool Pipeline::PastDeadline() const {
  return std::chrono::steady_clock::now() >= deadline_;
}

RunOutcome Pipeline::Run() {
  deadline_ = std::chrono::steady_clock::now() + conf_.run_timeout;
  logr::info << "[Pipeline] " << conf_.target << " ("
             << (conf_.optimize_and_test ? "optimize and test" : "analyze")
             << ", " << BrowserName(conf_.browser) << ")";
  return conf_.optimize_and_test ? OptimizeAndTest() : Analyze();
}

Pipeline::Site Pipeline::Acquire(MirrorStore& mirror) {
  Site site;
  FetchControl ctl;
  ctl.timeout = conf_.fetch_timeout;
  ctl.deadline = deadline_;
  ctl.cancelled = cancelled_;

  mirror.Reset();
  SiteFetcher fetcher(conf_, transport_, mirror);
  site.graph = fetcher.Fetch(conf_.target, ctl);

  const Resource& root = site.graph.Root();
  try {
    site.doc.emplace(HtmlDocument::Parse(root.bytes, root.url.ToString()));
  } catch (const std::runtime_error& e) {
    throw FetchError(root.url.ToString(), e.what());
  }

  if (site.graph.HasUnresolved()) {
    site.notes.push_back(std::to_string(site.graph.UnresolvedCount()) +
                         " referenced resource(s) could not be fetched");
  }

  SiteScript script(conf_.script_dir, root.url);
  site.hints = script.Hints(root.url, root.bytes);

  try {
    site.layout = layout_.Layout(*site.doc, site.graph, conf_.viewport);
  } catch (const NoViewportDataError& e) {
    logr::warning << "[Pipeline] " << e.what();
  }

  CriticalCssExtractor extractor(site.hints);
  site.critical = extractor.Extract(
    site.graph, *site.doc, site.layout ? &*site.layout : nullptr);
  if (site.critical.warning.has_value())
    site.notes.push_back(*site.critical.warning);
  return site;
}

MetricsDocument Pipeline::Audit(AuditRunner& runner, const std::string& target) {
  if (Cancelled())
    return AuditRunner::Placeholder(target, "run cancelled");
  if (PastDeadline())
    return AuditRunner::Placeholder(target, "run deadline reached");
  return runner.RunWithFallback(target);
}

RunOutcome Pipeline::OptimizeAndTest() {
  RunOutcome outcome;
  outcome.dir = conf_.SiteDir();
  MirrorStore mirror(outcome.dir, conf_.target);
  ArtifactWriter writer(outcome.dir);

  nlohmann::json run{{"url", conf_.target.ToString()},
                     {"mode", "optimize-and-test"},
                     {"browser", BrowserName(conf_.browser)}};

  Site site;
  try {
    site = Acquire(mirror);
  } catch (const FetchError& e) {
    logr::error << "[Pipeline] " << e.what();
    outcome.exit_code = kExitFetchFailed;
    run["status"] = "fetch_failed";
    run["error"] = e.what();
    SaveOrWarn(writer, "run.json", run);
    outcome.artifacts = writer.Written();
    return outcome;
  }

  bool partial = site.graph.HasUnresolved();
  SaveOrWarn(writer, "critical.css", site.critical.Text());

  if (Cancelled()) {
    logr::warning << "[Pipeline] cancelled; skipping optimization and audits";
    outcome.exit_code = kExitCancelled;
    outcome.partial = true;
    run["status"] = "cancelled";
    run["partial"] = true;
    run["unresolved"] = UnresolvedRefs(site.graph);
    SaveOrWarn(writer, "run.json", run);
    outcome.artifacts = writer.Written();
    return outcome;
  }

  HtmlDocument working = site.doc->Clone();
  ResourceOptimizer optimizer(site.hints);
  OptimizationResult optimized = optimizer.Optimize(
    site.graph, working, site.critical, site.layout ? &*site.layout : nullptr);

  // a variant that never reached the disk must not be referenced
  for (auto it = optimized.images.begin(); it != optimized.images.end();) {
    if (mirror.Store(it->local_path, it->bytes)) {
      ++it;
    } else {
      logr::warning << "[Pipeline] keeping original for " << it->url;
      it = optimized.images.erase(it);
    }
  }

  DocumentRewriter rewriter(site.graph, optimized);
  SaveOrWarn(writer, "optimized.html", rewriter.Rewrite(working, site.critical));
  SaveOrWarn(writer, "actions.json", ActionsJson(optimized.actions));

  if (PastDeadline()) {
    site.notes.push_back("run deadline reached before the audits");
    partial = true;
  }

  AuditRunner runner(analyzer_);
  std::error_code ec;
  const std::filesystem::path page =
    std::filesystem::absolute(outcome.dir / "optimized.html", ec);
  const MetricsDocument original = Audit(runner, conf_.target.ToString());
  const MetricsDocument after = Audit(runner, "file://" + page.string());
  if (original.degraded || after.degraded)
    partial = true;
  if (Cancelled())
    site.notes.push_back("run cancelled during the audits");

  ComparisonReport report =
    ComparisonReporter::Build(conf_.target.ToString(), original, after,
                              optimized.actions, partial, site.notes);
  SaveOrWarn(writer, "comparison_report.md",
             ComparisonReporter::Markdown(report));
  SaveOrWarn(writer, "comparison_report.html",
             ComparisonReporter::Html(report));
  SaveOrWarn(writer, "comparison_report.json", report.ToJson());

  if (original.degraded && after.degraded) {
    logr::error << "[Pipeline] both audits failed";
    outcome.exit_code = kExitAuditsFailed;
  }
  if (Cancelled())
    outcome.exit_code = kExitCancelled;
  outcome.partial = partial;

  run["status"] = outcome.exit_code == kExitOk            ? "ok"
                  : outcome.exit_code == kExitCancelled ? "cancelled"
                                                        : "audits_failed";
  run["partial"] = partial;
  run["resources"] = site.graph.Resources().size();
  run["unresolved"] = UnresolvedRefs(site.graph);
  run["actions_applied"] = optimized.AppliedCount();
  run["exit_code"] = outcome.exit_code;
  run["artifacts"] = PathList(writer.Written());
  SaveOrWarn(writer, "run.json", run);

  outcome.artifacts = writer.Written();
  outcome.report = std::move(report);
  logr::info << "[Pipeline] report written to " << outcome.dir
             << (partial ? " (partial)" : "");
  return outcome;
}

RunOutcome Pipeline::Analyze() {
  RunOutcome outcome;
  outcome.dir = conf_.reports_dir / conf_.SiteKey();
  ArtifactWriter writer(outcome.dir);

  AuditRunner runner(analyzer_);
  const MetricsDocument metrics = Audit(runner, conf_.target.ToString());
  const nlohmann::json raw =
    metrics.degraded ? nlohmann::json{} : runner.LastReport();

  std::optional<std::string> critical_css;
  if (conf_.extract_critical_css && !Cancelled()) {
    MirrorStore mirror(conf_.SiteDir(), conf_.target);
    try {
      Site site = Acquire(mirror);
      critical_css = site.critical.Text();
      outcome.partial =
        site.graph.HasUnresolved() || !site.critical.has_viewport_data;
    } catch (const FetchError& e) {
      logr::error << "[Pipeline] " << e.what();
      critical_css = std::string{"/* Error extracting critical CSS: "} +
                     e.what() + " */";
      outcome.partial = true;
    }
  }

  SaveOrWarn(writer, "pagespeed_optimization_report.json",
             Recommender::Report(conf_.target.ToString(), metrics, raw,
                                 critical_css));
  if (critical_css.has_value())
    SaveOrWarn(writer, "critical.css", *critical_css);

  if (metrics.degraded) {
    outcome.exit_code = Cancelled() ? kExitCancelled : kExitAuditsFailed;
    outcome.partial = true;
  }
  outcome.artifacts = writer.Written();
  logr::info << "[Pipeline] report written to " << outcome.dir;
  return outcome;
}
