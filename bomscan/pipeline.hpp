#pragma once

#include "bomscan.hpp"
#include "error.hpp"
#include "reconciliation.hpp"
#include "toolchain.hpp"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace bomscan {

enum class artifact_kind {
  dependency_listing,
  dependency_tree,
  module_versions,
  normalized_dependencies,
  sbom,
  sbom_cyclonedx,
  scan_report,
  scan_table,
  reconciliation,
};

// "dependency-tree", "sbom-cyclonedx", ...
std::string_view to_string(artifact_kind kind);

struct artifact {
  artifact_kind kind;
  fs::path location;
  std::optional<nlohmann::json> payload;
};

enum class stage_status { completed, skipped, unavailable };
std::string_view to_string(stage_status status);

struct stage_outcome {
  std::string name;
  stage_status status;
  std::string detail;
};

/**
 * @brief Mutable state of one pipeline execution. Owned by the worker running the job.
 */
struct pipeline_context {
  job_scope scope;
  toolchain &tools;
  std::optional<environment_handle> environment;
  std::optional<fs::path> build_tool;
  std::vector<artifact> artifacts;
  std::optional<reconciliation_outcome> reconciliation;

  pipeline_context(job_scope scope, toolchain &tools) : scope(std::move(scope)), tools(tools)
  {
  }

  [[nodiscard]] const artifact *find(artifact_kind kind) const;

  // Records a produced file. With load_payload the file is parsed as JSON, best-effort.
  void add(artifact_kind kind, const fs::path &location, bool load_payload = false);
};

class stage {
public:
  virtual ~stage() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  // Returns completed, skipped (precondition absent) or unavailable. A failure aborts the pipeline.
  virtual std::expected<stage_outcome, failure> run(pipeline_context &context) = 0;
};

// Stage backed by a callable
class function_stage final : public stage {
public:
  using function_type = std::function<std::expected<stage_outcome, failure>(pipeline_context &)>;

  function_stage(std::string name, function_type function) : stage_name(std::move(name)), function(std::move(function))
  {
  }

  [[nodiscard]] std::string_view name() const override
  {
    return stage_name;
  }
  std::expected<stage_outcome, failure> run(pipeline_context &context) override
  {
    return function(context);
  }

private:
  std::string stage_name;
  function_type function;
};

class pipeline {
public:
  explicit pipeline(std::string name) : pipeline_name(std::move(name))
  {
  }

  pipeline &then(std::unique_ptr<stage> next);
  pipeline &then(std::string name, function_stage::function_type function);

  // Runs every stage in order. The first failure aborts and is returned with the stage name attached.
  std::expected<std::vector<stage_outcome>, failure> run(pipeline_context &context) const;

  [[nodiscard]] const std::string &name() const
  {
    return pipeline_name;
  }
  [[nodiscard]] std::vector<std::string> stage_names() const;

private:
  std::string pipeline_name;
  std::vector<std::unique_ptr<stage>> stages;
};

/**
 * @brief Strategy table from (language, dependency manager) to the pipeline for that ecosystem.
 *
 * A manager of "*" matches every manager of the language. Exact matches win.
 */
class stage_router {
public:
  using factory = std::function<pipeline()>;

  // Registers the Python, Go and Maven pipelines
  stage_router();

  void add(std::string language, std::string manager, factory make_pipeline);
  [[nodiscard]] std::optional<pipeline> route(const detection &detected) const;

private:
  std::map<std::pair<std::string, std::string>, factory> table;
};

pipeline make_python_pipeline();
pipeline make_go_modules_pipeline();
pipeline make_maven_pipeline();

struct scan_job {
  std::string id;
  std::string source;
  fs::path job_directory;
  std::stop_token stop;
  std::shared_ptr<spdlog::logger> log;
  std::function<void(const detection &)> on_detected;
};

// Fetch, detect, route and execute. Returns the aggregated report document.
std::expected<nlohmann::json, failure> run_scan_pipeline(const scan_job &job, toolchain &tools, const stage_router &router);

} // namespace bomscan
