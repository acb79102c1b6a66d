#include "toolchain.hpp"
#include "language_detector.hpp"
#include "utilities.hpp"
#include "inja/inja.hpp"
#include <chrono>
#include <format>

namespace bomscan {

namespace {
std::expected<void, failure> expect_file(const fs::path &file, errc kind, std::string_view producer)
{
  std::error_code ec;
  if (!fs::exists(file, ec))
    return std::unexpected(failure{ kind, std::format("{} did not produce '{}'", producer, file.string()) });
  return {};
}

fs::path maven_executable(const fs::path &maven_home)
{
#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
  return maven_home / "bin" / "mvn.cmd";
#else
  return maven_home / "bin" / "mvn";
#endif
}
} // namespace

std::optional<fs::path> find_declared_manifest(const fs::path &repository)
{
  for (const auto name: { "requirements.txt", "pyproject.toml", "setup.py" }) {
    std::error_code ec;
    if (fs::is_regular_file(repository / name, ec))
      return repository / name;
  }
  return std::nullopt;
}

detection toolchain::detect(const fs::path &repository)
{
  return detect_ecosystem(repository);
}

process_toolchain::process_toolchain(const configuration &config) : config(config)
{
}

std::expected<void, failure> process_toolchain::run_operation(const std::string &operation, const nlohmann::json &data, const fs::path &working_directory, errc kind, const job_scope &scope) const
{
  const auto &commands = config.commands_for(operation);
  if (commands.empty())
    return std::unexpected(failure{ errc::invalid_configuration, std::format("No commands configured for '{}'", operation) });

  // One deadline for every command of the operation
  using clock         = std::chrono::steady_clock;
  const auto deadline = clock::now() + config.stage_timeout;

  inja::Environment inja_environment;
  for (std::size_t i = 0; i < commands.size(); ++i) {
    std::string command;
    try {
      command = inja_environment.render(commands[i], data);
    } catch (const std::exception &e) {
      return std::unexpected(failure{ errc::invalid_configuration, std::format("Template error in '{}': {}\n{}", operation, commands[i], e.what()) });
    }

    std::chrono::milliseconds remaining{ 0 };
    if (config.stage_timeout.count() > 0) {
      remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
      if (remaining.count() <= 0) {
        scope.logger().error("{}: exceeded {}s before '{}'", operation, config.stage_timeout.count(), command);
        return std::unexpected(failure{ errc::timeout, std::format("'{}' exceeded {}s before '{}' started", operation, config.stage_timeout.count(), command) });
      }
    }

    scope.logger().info("{}: {}", operation, command);
    const exec_options options{
      .working_directory = working_directory,
      .log_file          = scope.job_directory / std::format("{}-{}.log", operation, i),
      .timeout           = remaining,
      .stop              = scope.stop,
    };

    auto result = exec(command, "", options);
    if (!result) {
      scope.logger().error("{}: {}", operation, result.error().describe());
      return std::unexpected(result.error());
    }

    if (result->retcode != 0) {
      scope.logger().error("{}: returned {}\n{}", operation, result->retcode, result->result);
      return std::unexpected(failure{ kind, std::format("'{}' returned {}\n{}", command, result->retcode, result->result) });
    }
    scope.logger().debug(result->result);
  }
  return {};
}

std::expected<fs::path, failure> process_toolchain::fetch(std::string_view source_reference, const job_scope &scope)
{
  const auto [url, branch] = split_source_reference(source_reference);
  if (auto valid = validate_source_reference(url, branch); !valid) {
    scope.logger().error("{}", valid.error().message);
    return std::unexpected(valid.error());
  }

  const auto checkout = scope.job_directory / repository_name_from_url(url);
  std::error_code ec;
  if (fs::exists(checkout, ec)) {
    scope.logger().info("Removing {}", checkout.string());
    fs::remove_all(checkout, ec);
    if (ec)
      return std::unexpected(failure{ errc::fetch_error, std::format("Cannot remove stale checkout '{}': {}", checkout.string(), ec.message()) });
  }

  const nlohmann::json data = {
    { "url", url }, { "branch", branch }, { "has_branch", !branch.empty() }, { "checkout", checkout.string() }, { "job_dir", scope.job_directory.string() },
  };
  if (auto result = run_operation("fetch", data, scope.job_directory, errc::fetch_error, scope); !result)
    return std::unexpected(result.error());

  if (auto result = expect_file(checkout, errc::fetch_error, "git clone"); !result)
    return std::unexpected(result.error());

  return fs::absolute(checkout);
}

std::expected<environment_handle, failure> process_toolchain::prepare_environment(const job_scope &scope)
{
  environment_handle environment;
  environment.location = scope.job_directory / environment_directory_name;
#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
  environment.python = environment.location / "Scripts" / "python.exe";
#else
  environment.python = environment.location / "bin" / "python";
#endif

  const nlohmann::json data = {
    { "venv", environment.location.string() }, { "python", environment.python.string() }, { "repo", scope.repository.string() }, { "job_dir", scope.job_directory.string() },
  };
  if (auto result = run_operation("prepare_environment", data, scope.job_directory, errc::dependency_install_error, scope); !result)
    return std::unexpected(result.error());

  return environment;
}

std::expected<void, failure> process_toolchain::install_declared_dependencies(const environment_handle &environment, const job_scope &scope)
{
  const auto manifest = find_declared_manifest(scope.repository);
  if (!manifest)
    return std::unexpected(failure{ errc::dependency_install_error, std::format("No declared dependencies in '{}'", scope.repository.string()) });

  const auto install_arguments = manifest->filename() == "requirements.txt" ? std::format(R"(-r "{}")", manifest->string()) : std::format(R"("{}")", scope.repository.string());

  const nlohmann::json data = {
    { "venv", environment.location.string() }, { "python", environment.python.string() },   { "repo", scope.repository.string() },
    { "job_dir", scope.job_directory.string() }, { "install_arguments", install_arguments },
  };
  return run_operation("install_dependencies", data, scope.repository, errc::dependency_install_error, scope);
}

std::expected<fs::path, failure> process_toolchain::generate_sbom(const sbom_request &request, const job_scope &scope)
{
  nlohmann::json data = {
    { "input", request.input.string() }, { "output", request.output.string() }, { "repo", scope.repository.string() }, { "job_dir", scope.job_directory.string() },
  };
  if (request.environment) {
    data["venv"]   = request.environment->location.string();
    data["python"] = request.environment->python.string();
  }

  std::expected<void, failure> result;
  switch (request.source) {
    case sbom_source::requirements_file:
      result = run_operation("generate_sbom_requirements", data, scope.job_directory, errc::sbom_generation_error, scope);
      break;
    case sbom_source::module_graph:
      result = run_operation("generate_sbom_module_graph", data, scope.repository, errc::sbom_generation_error, scope);
      break;
    case sbom_source::maven_plugin:
      data["build_tool"] = request.input.string();
      data["plugin"]     = config.maven.plugin;
      result             = run_operation("generate_sbom_maven", data, scope.repository, errc::sbom_generation_error, scope);
      break;
  }
  if (!result)
    return std::unexpected(result.error());

  if (auto produced = expect_file(request.output, errc::sbom_generation_error, "SBOM generation"); !produced)
    return std::unexpected(produced.error());
  return request.output;
}

std::expected<scan_reports, failure> process_toolchain::scan(const fs::path &sbom, const scan_reports &destination, const job_scope &scope)
{
  const nlohmann::json data = {
    { "sbom", sbom.string() },
    { "structured", destination.structured.string() },
    { "flat", destination.flat.string() },
    { "table", destination.table.string() },
    { "job_dir", scope.job_directory.string() },
  };
  if (auto result = run_operation("scan", data, scope.job_directory, errc::scan_error, scope); !result)
    return std::unexpected(result.error());

  for (const auto &report: { destination.structured, destination.flat, destination.table })
    if (auto produced = expect_file(report, errc::scan_error, "trivy"); !produced)
      return std::unexpected(produced.error());

  return destination;
}

std::expected<fs::path, failure> process_toolchain::acquire_build_tool(const job_scope &scope)
{
  if (!config.maven.home.empty()) {
    const auto configured = maven_executable(config.maven.home);
    std::error_code ec;
    if (fs::exists(configured, ec))
      return fs::absolute(configured);
    scope.logger().warn("Configured Maven home '{}' has no executable", config.maven.home.string());
  }

  if (auto on_path = find_executable("mvn")) {
    scope.logger().info("Using Maven from {}", on_path->string());
    return *on_path;
  }

  // Jobs share the tools directory
  std::lock_guard<std::mutex> lock(build_tool_mutex);
  return download_build_tool(scope);
}

std::expected<fs::path, failure> process_toolchain::download_build_tool(const job_scope &scope)
{
  const auto install_dir = fs::absolute(config.tools_home);
  const auto maven_home  = install_dir / std::format("apache-maven-{}", config.maven.version);
  const auto executable  = maven_executable(maven_home);

  std::error_code ec;
  if (fs::exists(executable, ec)) {
    scope.logger().info("Maven already extracted at {}", maven_home.string());
    return executable;
  }

  fs::create_directories(install_dir, ec);
  if (ec)
    return std::unexpected(failure{ errc::tool_acquisition_error, std::format("Cannot create '{}': {}", install_dir.string(), ec.message()) });

  std::string url;
  try {
    inja::Environment inja_environment;
    url = inja_environment.render(config.maven.url, nlohmann::json{ { "version", config.maven.version } });
  } catch (const std::exception &e) {
    return std::unexpected(failure{ errc::invalid_configuration, std::format("Template error in Maven url: {}", e.what()) });
  }

  const auto archive        = install_dir / std::format("apache-maven-{}-bin.zip", config.maven.version);
  const nlohmann::json data = {
    { "url", url }, { "archive", archive.string() }, { "install_dir", install_dir.string() }, { "version", config.maven.version },
  };

  // Keep the download log with the job that triggered it
  if (auto result = run_operation("download_build_tool", data, install_dir, errc::tool_acquisition_error, scope); !result)
    return std::unexpected(result.error());

  if (auto produced = expect_file(executable, errc::tool_acquisition_error, "Maven download"); !produced)
    return std::unexpected(produced.error());

  for (const auto &entry: fs::directory_iterator(maven_home / "bin", ec)) {
    fs::permissions(entry.path(), fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec, fs::perm_options::replace, ec);
  }

  scope.logger().info("Maven {} installed at {}", config.maven.version, maven_home.string());
  return executable;
}

std::expected<void, failure> process_toolchain::tidy_modules(const job_scope &scope)
{
  const nlohmann::json data = { { "repo", scope.repository.string() }, { "job_dir", scope.job_directory.string() } };
  return run_operation("tidy_modules", data, scope.repository, errc::dependency_install_error, scope);
}

std::expected<fs::path, failure> process_toolchain::list_module_versions(const fs::path &output, const job_scope &scope)
{
  const nlohmann::json data = { { "output", output.string() }, { "repo", scope.repository.string() }, { "job_dir", scope.job_directory.string() } };
  if (auto result = run_operation("list_module_versions", data, scope.repository, errc::dependency_install_error, scope); !result)
    return std::unexpected(result.error());

  if (auto produced = expect_file(output, errc::dependency_install_error, "go list"); !produced)
    return std::unexpected(produced.error());
  return output;
}

std::expected<void, failure> process_toolchain::install_tree_renderer(const job_scope &scope)
{
  const nlohmann::json data = { { "repo", scope.repository.string() }, { "job_dir", scope.job_directory.string() } };
  return run_operation("install_tree_renderer", data, scope.job_directory, errc::tool_acquisition_error, scope);
}

std::expected<fs::path, failure> process_toolchain::render_dependency_tree(const fs::path &output, const job_scope &scope)
{
  const nlohmann::json data = {
    { "output", output.string() },
    { "graph", (scope.job_directory / "mod_graph.txt").string() },
    { "repo", scope.repository.string() },
    { "job_dir", scope.job_directory.string() },
  };
  if (auto result = run_operation("render_dependency_tree", data, scope.repository, errc::dependency_install_error, scope); !result)
    return std::unexpected(result.error());

  if (auto produced = expect_file(output, errc::dependency_install_error, "deptree"); !produced)
    return std::unexpected(produced.error());
  return output;
}

} // namespace bomscan
