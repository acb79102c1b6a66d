#pragma once

#include "bomscan.hpp"
#include "configuration.hpp"
#include "error.hpp"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace bomscan {

// Everything an external tool invocation of one job needs. All paths are absolute.
struct job_scope {
  std::string job_id;
  fs::path job_directory;
  fs::path repository;
  std::stop_token stop;
  std::shared_ptr<spdlog::logger> log;

  [[nodiscard]] spdlog::logger &logger() const
  {
    return log ? *log : *spdlog::default_logger();
  }
};

struct environment_handle {
  fs::path location;
  fs::path python;
};

struct scan_reports {
  fs::path structured; // CycloneDX with vulnerabilities
  fs::path flat;       // scanner JSON report
  fs::path table;      // human readable table
};

enum class sbom_source { requirements_file, module_graph, maven_plugin };

struct sbom_request {
  sbom_source source;
  fs::path input; // dependency file for requirements_file, build tool for maven_plugin
  fs::path output;
  std::optional<environment_handle> environment;
};

// Declared dependency manifest of a Python checkout: requirements.txt, pyproject.toml or setup.py
std::optional<fs::path> find_declared_manifest(const fs::path &repository);

/**
 * @brief External collaborators consumed by the pipeline stages.
 *
 * Every operation receives the job scope and must only touch paths derived from it.
 */
class toolchain {
public:
  virtual ~toolchain() = default;

  virtual std::expected<fs::path, failure> fetch(std::string_view source_reference, const job_scope &scope) = 0;
  virtual detection detect(const fs::path &repository);

  virtual std::expected<environment_handle, failure> prepare_environment(const job_scope &scope)                                          = 0;
  virtual std::expected<void, failure> install_declared_dependencies(const environment_handle &environment, const job_scope &scope)      = 0;
  virtual std::expected<fs::path, failure> generate_sbom(const sbom_request &request, const job_scope &scope)                           = 0;
  virtual std::expected<scan_reports, failure> scan(const fs::path &sbom, const scan_reports &destination, const job_scope &scope)       = 0;
  virtual std::expected<fs::path, failure> acquire_build_tool(const job_scope &scope)                                                    = 0;

  // Go module graph operations
  virtual std::expected<void, failure> tidy_modules(const job_scope &scope)                                                              = 0;
  virtual std::expected<fs::path, failure> list_module_versions(const fs::path &output, const job_scope &scope)                         = 0;
  virtual std::expected<void, failure> install_tree_renderer(const job_scope &scope)                                                     = 0;
  virtual std::expected<fs::path, failure> render_dependency_tree(const fs::path &output, const job_scope &scope)                       = 0;
};

/**
 * @brief Runs the real tools (git, uv, go, deptree, cyclonedx, mvn, trivy) as child processes.
 *        Command lines come from the configuration as inja templates.
 */
class process_toolchain final : public toolchain {
public:
  explicit process_toolchain(const configuration &config);

  std::expected<fs::path, failure> fetch(std::string_view source_reference, const job_scope &scope) override;
  std::expected<environment_handle, failure> prepare_environment(const job_scope &scope) override;
  std::expected<void, failure> install_declared_dependencies(const environment_handle &environment, const job_scope &scope) override;
  std::expected<fs::path, failure> generate_sbom(const sbom_request &request, const job_scope &scope) override;
  std::expected<scan_reports, failure> scan(const fs::path &sbom, const scan_reports &destination, const job_scope &scope) override;
  std::expected<fs::path, failure> acquire_build_tool(const job_scope &scope) override;
  std::expected<void, failure> tidy_modules(const job_scope &scope) override;
  std::expected<fs::path, failure> list_module_versions(const fs::path &output, const job_scope &scope) override;
  std::expected<void, failure> install_tree_renderer(const job_scope &scope) override;
  std::expected<fs::path, failure> render_dependency_tree(const fs::path &output, const job_scope &scope) override;

private:
  std::expected<void, failure> run_operation(const std::string &operation, const nlohmann::json &data, const fs::path &working_directory, errc kind, const job_scope &scope) const;
  std::expected<fs::path, failure> download_build_tool(const job_scope &scope);

  const configuration &config;
  std::mutex build_tool_mutex;
};

} // namespace bomscan
