#include "pipeline.hpp"
#include "dependency_set.hpp"
#include "utilities.hpp"
#include <algorithm>
#include <format>

namespace bomscan {

namespace {
stage_outcome completed(std::string_view name, std::string detail = {})
{
  return { std::string(name), stage_status::completed, std::move(detail) };
}

stage_outcome skipped(std::string_view name, std::string detail)
{
  return { std::string(name), stage_status::skipped, std::move(detail) };
}

stage_outcome unavailable(std::string_view name, std::string detail)
{
  return { std::string(name), stage_status::unavailable, std::move(detail) };
}

bool file_exists(const fs::path &file)
{
  std::error_code ec;
  return fs::is_regular_file(file, ec);
}

// Report key for an artifact location, e.g. "sbom_cyclonedx_path"
std::string path_key(artifact_kind kind)
{
  std::string key{ to_string(kind) };
  std::ranges::replace(key, '-', '_');
  return key + "_path";
}

/**
 * Stages shared by the ecosystems
 */
function_stage::function_type scan_stage(std::string structured, std::string flat, std::string table)
{
  return [=](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    const auto *sbom = context.find(artifact_kind::sbom);
    if (sbom == nullptr)
      return skipped("scan-sbom", "no SBOM was generated");

    const auto &job_directory = context.scope.job_directory;
    const scan_reports destination{ job_directory / structured, job_directory / flat, job_directory / table };

    auto reports = context.tools.scan(sbom->location, destination, context.scope);
    if (!reports)
      return std::unexpected(reports.error());

    context.add(artifact_kind::sbom_cyclonedx, reports->structured, true);
    context.add(artifact_kind::scan_report, reports->flat, true);
    context.add(artifact_kind::scan_table, reports->table);
    return completed("scan-sbom");
  };
}

function_stage::function_type reconcile_stage(artifact_kind tree_kind, artifact_kind sbom_kind)
{
  return [=](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    const auto *tree = context.find(tree_kind);
    const auto *sbom = context.find(sbom_kind);
    if (tree == nullptr || sbom == nullptr) {
      const auto reason       = std::format("no {} to compare", tree == nullptr ? to_string(tree_kind) : to_string(sbom_kind));
      context.reconciliation = std::unexpected(reconciliation_unavailable{ failure{ errc::not_found, reason } });
      return skipped("reconcile", reason);
    }

    auto outcome = reconcile_files(tree->location, sbom->location);
    context.reconciliation = outcome;
    if (!outcome) {
      context.scope.logger().warn("Reconciliation unavailable: {}", outcome.error().reason.describe());
      return unavailable("reconcile", outcome.error().reason.describe());
    }

    const auto comparison = context.scope.job_directory / comparison_filename;
    if (auto written = write_text_file(comparison, render_report(*outcome)); !written) {
      context.scope.logger().warn("{}", written.error().describe());
    } else {
      context.add(artifact_kind::reconciliation, comparison);
    }

    return completed("reconcile",
                     std::format("{} missing, {} mismatched, {} same, {} extra",
                                 outcome->missing_in_sbom.size(),
                                 outcome->version_mismatches.size(),
                                 outcome->same.size(),
                                 outcome->extra_in_sbom.size()));
  };
}
} // namespace

std::string_view to_string(artifact_kind kind)
{
  switch (kind) {
    case artifact_kind::dependency_listing:
      return "dependency-listing";
    case artifact_kind::dependency_tree:
      return "dependency-tree";
    case artifact_kind::module_versions:
      return "module-versions";
    case artifact_kind::normalized_dependencies:
      return "normalized-dependencies";
    case artifact_kind::sbom:
      return "sbom";
    case artifact_kind::sbom_cyclonedx:
      return "sbom-cyclonedx";
    case artifact_kind::scan_report:
      return "scan-report";
    case artifact_kind::scan_table:
      return "scan-table";
    case artifact_kind::reconciliation:
      return "reconciliation";
  }
  return "unknown";
}

std::string_view to_string(stage_status status)
{
  switch (status) {
    case stage_status::completed:
      return "completed";
    case stage_status::skipped:
      return "skipped";
    case stage_status::unavailable:
      return "unavailable";
  }
  return "unknown";
}

const artifact *pipeline_context::find(artifact_kind kind) const
{
  const auto it = std::ranges::find(artifacts, kind, &artifact::kind);
  return it == artifacts.end() ? nullptr : &*it;
}

void pipeline_context::add(artifact_kind kind, const fs::path &location, bool load_payload)
{
  artifact produced{ kind, fs::absolute(location), std::nullopt };
  if (load_payload) {
    produced.payload = try_load_json(produced.location);
    if (!produced.payload)
      scope.logger().warn("Could not parse {} at {}", to_string(kind), produced.location.string());
  }

  // A kind is produced once per job; a later producer replaces the earlier record
  auto it = std::ranges::find(artifacts, kind, &artifact::kind);
  if (it != artifacts.end())
    *it = std::move(produced);
  else
    artifacts.push_back(std::move(produced));
}

pipeline &pipeline::then(std::unique_ptr<stage> next)
{
  stages.push_back(std::move(next));
  return *this;
}

pipeline &pipeline::then(std::string name, function_stage::function_type function)
{
  return then(std::make_unique<function_stage>(std::move(name), std::move(function)));
}

std::vector<std::string> pipeline::stage_names() const
{
  std::vector<std::string> names;
  for (const auto &s: stages)
    names.emplace_back(s->name());
  return names;
}

std::expected<std::vector<stage_outcome>, failure> pipeline::run(pipeline_context &context) const
{
  std::vector<stage_outcome> outcomes;
  auto &log = context.scope.logger();

  for (const auto &s: stages) {
    if (context.scope.stop.stop_requested())
      return std::unexpected(failure{ errc::cancelled, std::format("Cancelled before stage '{}'", s->name()) });

    log.info("Stage '{}' started", s->name());
    auto outcome = s->run(context);
    if (!outcome) {
      log.error("Stage '{}' failed: {}", s->name(), outcome.error().describe());
      return std::unexpected(failure{ outcome.error().code, std::format("stage '{}' failed\n{}", s->name(), outcome.error().message) });
    }

    log.info("Stage '{}' {}{}", s->name(), to_string(outcome->status), outcome->detail.empty() ? "" : ": " + outcome->detail);
    outcomes.push_back(std::move(*outcome));
  }
  return outcomes;
}

stage_router::stage_router()
{
  add("Python", "*", make_python_pipeline);
  add("Go", "go modules", make_go_modules_pipeline);
  add("Java", "maven", make_maven_pipeline);
}

void stage_router::add(std::string language, std::string manager, factory make_pipeline)
{
  table[{ std::move(language), std::move(manager) }] = std::move(make_pipeline);
}

std::optional<pipeline> stage_router::route(const detection &detected) const
{
  auto it = table.find({ detected.language, detected.manager });
  if (it == table.end())
    it = table.find({ detected.language, "*" });
  if (it == table.end())
    return std::nullopt;
  return it->second();
}

pipeline make_python_pipeline()
{
  pipeline p{ "python" };

  p.then("prepare-environment", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    auto environment = context.tools.prepare_environment(context.scope);
    if (!environment)
      return std::unexpected(environment.error());
    context.environment = std::move(*environment);
    return completed("prepare-environment", context.environment->location.string());
  });

  p.then("install-dependencies", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    if (!context.environment)
      return skipped("install-dependencies", "no environment");
    if (!find_declared_manifest(context.scope.repository))
      return skipped("install-dependencies", "no declared dependency manifest");

    if (auto result = context.tools.install_declared_dependencies(*context.environment, context.scope); !result)
      return std::unexpected(result.error());

    const auto listing = context.scope.job_directory / python_dependency_files[0];
    if (file_exists(listing))
      context.add(artifact_kind::dependency_listing, listing);
    const auto resolver_tree = context.scope.job_directory / python_resolver_tree;
    if (file_exists(resolver_tree))
      context.add(artifact_kind::dependency_tree, resolver_tree, true);
    return completed("install-dependencies");
  });

  p.then("normalize-manifest", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    const auto *manifest = context.find(artifact_kind::dependency_tree);
    if (manifest == nullptr)
      return skipped("normalize-manifest", "no resolver manifest");
    if (!manifest->payload)
      return unavailable("normalize-manifest", std::format("'{}' is not valid JSON", manifest->location.string()));

    auto normalized = normalize_manifest(*manifest->payload);
    if (!normalized)
      return unavailable("normalize-manifest", normalized.error().describe());

    const auto destination = context.scope.job_directory / normalized_manifest_filename;
    if (auto written = write_text_file(destination, normalized->dump(2)); !written)
      return unavailable("normalize-manifest", written.error().describe());

    context.add(artifact_kind::normalized_dependencies, destination);
    return completed("normalize-manifest");
  });

  p.then("generate-sbom", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    std::optional<fs::path> input;
    for (const auto &name: python_dependency_files)
      if (file_exists(context.scope.job_directory / name)) {
        input = context.scope.job_directory / name;
        break;
      }
    if (!input)
      return skipped("generate-sbom", "no resolved dependency file");

    const sbom_request request{ sbom_source::requirements_file, *input, context.scope.job_directory / "sbom.json", context.environment };
    auto sbom = context.tools.generate_sbom(request, context.scope);
    if (!sbom)
      return std::unexpected(sbom.error());
    context.add(artifact_kind::sbom, *sbom, true);
    return completed("generate-sbom", input->filename().string());
  });

  p.then("scan-sbom", scan_stage("sbom_p.json", "trivy_report.json", "table_trivy.txt"));
  p.then("reconcile", reconcile_stage(artifact_kind::normalized_dependencies, artifact_kind::sbom_cyclonedx));
  return p;
}

pipeline make_go_modules_pipeline()
{
  pipeline p{ "go modules" };

  p.then("tidy-modules", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    if (auto result = context.tools.tidy_modules(context.scope); !result)
      return std::unexpected(result.error());
    return completed("tidy-modules");
  });

  p.then("list-module-versions", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    auto listing = context.tools.list_module_versions(context.scope.job_directory / "upgradefile.txt", context.scope);
    if (!listing)
      return std::unexpected(listing.error());
    context.add(artifact_kind::module_versions, *listing);
    return completed("list-module-versions");
  });

  p.then("install-tree-renderer", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    if (auto result = context.tools.install_tree_renderer(context.scope); !result)
      return std::unexpected(result.error());
    return completed("install-tree-renderer");
  });

  p.then("render-dependency-tree", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    auto tree = context.tools.render_dependency_tree(context.scope.job_directory / "t.json", context.scope);
    if (!tree)
      return std::unexpected(tree.error());
    context.add(artifact_kind::dependency_tree, *tree);
    return completed("render-dependency-tree");
  });

  p.then("generate-sbom", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    const sbom_request request{ sbom_source::module_graph, context.scope.repository, context.scope.job_directory / "sbom.json", std::nullopt };
    auto sbom = context.tools.generate_sbom(request, context.scope);
    if (!sbom)
      return std::unexpected(sbom.error());
    context.add(artifact_kind::sbom, *sbom, true);
    return completed("generate-sbom");
  });

  p.then("scan-sbom", scan_stage("sbom_trivy_cyclonedx.json", "sbom_trivy.json", "sbom_trivy_table.txt"));
  p.then("reconcile", reconcile_stage(artifact_kind::dependency_tree, artifact_kind::sbom));
  return p;
}

pipeline make_maven_pipeline()
{
  pipeline p{ "maven" };

  p.then("acquire-build-tool", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    auto tool = context.tools.acquire_build_tool(context.scope);
    if (!tool)
      return std::unexpected(tool.error());
    context.build_tool = std::move(*tool);
    return completed("acquire-build-tool", context.build_tool->string());
  });

  p.then("generate-sbom", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    if (!context.build_tool)
      return skipped("generate-sbom", "no build tool");
    if (!file_exists(context.scope.repository / "pom.xml"))
      return skipped("generate-sbom", "no pom.xml at the repository root");

    const sbom_request request{ sbom_source::maven_plugin, *context.build_tool, context.scope.repository / "target" / "bom.json", std::nullopt };
    auto sbom = context.tools.generate_sbom(request, context.scope);
    if (!sbom)
      return std::unexpected(sbom.error());
    return completed("generate-sbom", sbom->string());
  });

  p.then("copy-sbom", [](pipeline_context &context) -> std::expected<stage_outcome, failure> {
    const auto generated = context.scope.repository / "target" / "bom.json";
    if (!file_exists(generated))
      return skipped("copy-sbom", "the build produced no target/bom.json");

    const auto destination = context.scope.job_directory / "sbom.json";
    std::error_code ec;
    fs::copy_file(generated, destination, fs::copy_options::overwrite_existing, ec);
    if (ec)
      return std::unexpected(failure{ errc::io_error, std::format("Cannot copy '{}' to '{}': {}", generated.string(), destination.string(), ec.message()) });

    context.add(artifact_kind::sbom, destination, true);
    return completed("copy-sbom");
  });

  p.then("scan-sbom", scan_stage("sbom_trivy_cyclonedx.json", "sbom_trivy.json", "sbom_trivy_table.txt"));
  return p;
}

std::expected<nlohmann::json, failure> run_scan_pipeline(const scan_job &job, toolchain &tools, const stage_router &router)
{
  job_scope scope{ job.id, fs::absolute(job.job_directory), {}, job.stop, job.log };
  auto &log = scope.logger();

  if (scope.stop.stop_requested())
    return std::unexpected(failure{ errc::cancelled, "Cancelled before fetch" });

  log.info("Fetching {}", job.source);
  auto repository = tools.fetch(job.source, scope);
  if (!repository) {
    log.error("{}", repository.error().describe());
    return std::unexpected(failure{ repository.error().code, std::format("stage 'fetch' failed\n{}", repository.error().message) });
  }
  scope.repository = *repository;

  const auto detected = tools.detect(scope.repository);
  log.info("Detected language '{}' with dependency manager '{}'", detected.language, detected.manager);
  if (job.on_detected)
    job.on_detected(detected);

  nlohmann::json report;
  report["repo"]      = job.source;
  report["artifacts"] = {
    { "system", host_os_string },
    { "repo_path", scope.repository.string() },
    { "language", detected.language },
    { "dependency_manager", detected.manager },
    { "unsupported", false },
  };
  report["result_files"] = nlohmann::json::array();
  report["results"]      = {
    { "trivy_report_json", nullptr },
    { "trivy_cyclonedx_json", nullptr },
    { "reconciliation", nullptr },
  };
  report["stages"] = nlohmann::json::array();

  auto selected = router.route(detected);
  if (!selected) {
    log.warn("Unsupported combination: {} / {}", detected.language, detected.manager);
    report["artifacts"]["unsupported"] = true;
    report["pipeline"]                 = nullptr;
    report["generated_at"]             = now_iso();
    return report;
  }

  pipeline_context context{ scope, tools };
  auto outcomes = selected->run(context);
  if (!outcomes)
    return std::unexpected(outcomes.error());

  for (const auto &a: context.artifacts) {
    report["artifacts"][path_key(a.kind)] = a.location.string();
    report["result_files"].push_back(a.location.string());
  }

  if (const auto *scan_report = context.find(artifact_kind::scan_report); scan_report && scan_report->payload)
    report["results"]["trivy_report_json"] = *scan_report->payload;
  if (const auto *cyclonedx = context.find(artifact_kind::sbom_cyclonedx); cyclonedx && cyclonedx->payload)
    report["results"]["trivy_cyclonedx_json"] = *cyclonedx->payload;
  if (context.reconciliation)
    report["results"]["reconciliation"] = to_json(*context.reconciliation);

  for (const auto &o: *outcomes)
    report["stages"].push_back({ { "name", o.name }, { "status", std::string(to_string(o.status)) }, { "detail", o.detail } });

  report["pipeline"]     = selected->name();
  report["generated_at"] = now_iso();
  return report;
}

} // namespace bomscan
