#include "configuration.hpp"
#include "bomscan.hpp"
#include <algorithm>
#include <cstdlib>
#include <format>
#include <thread>

namespace bomscan {

namespace {
fs::path expand_home(const std::string &path)
{
  if (!path.starts_with('~'))
    return path;

#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
  const char *home = std::getenv("USERPROFILE");
#else
  const char *home = std::getenv("HOME");
#endif
  if (home == nullptr)
    return fs::path{ "." } / path.substr(1);
  return fs::path{ std::string(home) + path.substr(1) };
}

fs::path default_tools_home()
{
  return expand_home("~/.bomscan/tools");
}
} // namespace

command_table default_commands()
{
  // clang-format off
  return {
    { "fetch", {
        R"(git clone --progress {% if has_branch %}-b "{{ branch }}" --single-branch {% endif %}"{{ url }}" "{{ checkout }}")" } },
    { "prepare_environment", {
        R"(uv venv "{{ venv }}")" } },
    { "install_dependencies", {
        R"(uv pip install --python "{{ python }}" {{ install_arguments }})",
        R"(uv pip freeze --python "{{ python }}" > "{{ job_dir }}/all-dep.txt")",
        R"(uv pip install --python "{{ python }}" pipdeptree)",
        R"("{{ python }}" -m pipdeptree --json-tree > "{{ job_dir }}/dets.json")" } },
    { "generate_sbom_requirements", {
        R"(uv pip install --python "{{ python }}" cyclonedx-bom)",
        R"("{{ python }}" -m cyclonedx_py requirements "{{ input }}" --of JSON -o "{{ output }}")" } },
    { "tidy_modules", {
        "go mod tidy" } },
    { "list_module_versions", {
        R"(go list -u -m -json all > "{{ output }}")" } },
    { "install_tree_renderer", {
        "go install github.com/vc60er/deptree@latest" } },
    { "render_dependency_tree", {
        R"(go mod graph > "{{ graph }}")",
        R"(deptree -json < "{{ graph }}" > "{{ output }}")" } },
    { "generate_sbom_module_graph", {
        R"(cyclonedx-gomod mod -json -output "{{ output }}" .)" } },
    { "generate_sbom_maven", {
        R"("{{ build_tool }}" -B {{ plugin }} -DoutputFormat=json)" } },
    { "download_build_tool", {
        R"(curl -fSL "{{ url }}" -o "{{ archive }}")",
        R"(unzip -q -o "{{ archive }}" -d "{{ install_dir }}")" } },
    { "scan", {
        R"(trivy sbom "{{ sbom }}" --format cyclonedx --scanners vuln -o "{{ structured }}")",
        R"(trivy sbom "{{ sbom }}" --format json --scanners vuln -o "{{ flat }}")",
        R"(trivy sbom "{{ sbom }}" --format table --scanners vuln -o "{{ table }}")" } },
  };
  // clang-format on
}

configuration::configuration()
    : jobs_path(fs::absolute(default_jobs_directory)), tools_home(default_tools_home()), workers(std::max(1u, std::thread::hardware_concurrency())), commands(default_commands())
{
}

std::expected<void, failure> configuration::load_config_file(const fs::path &config_file_path)
{
  try {
    if (!fs::exists(config_file_path))
      return {};

    const auto config = YAML::LoadFile(config_file_path.string());

    if (config["jobs"])
      jobs_path = fs::absolute(expand_home(config["jobs"].as<std::string>()));

    if (config["tools_home"])
      tools_home = fs::absolute(expand_home(config["tools_home"].as<std::string>()));

    if (config["workers"]) {
      const auto count = config["workers"].as<int>();
      if (count < 1)
        return std::unexpected(failure{ errc::invalid_configuration, std::format("'workers' must be at least 1, got {}", count) });
      workers = static_cast<std::size_t>(count);
    }

    if (config["stage_timeout"]) {
      const auto seconds = config["stage_timeout"].as<long>();
      if (seconds < 0)
        return std::unexpected(failure{ errc::invalid_configuration, "'stage_timeout' cannot be negative" });
      stage_timeout = std::chrono::seconds(seconds);
    }

    if (config["log_level"]) {
      log_level = spdlog::level::from_str(config["log_level"].as<std::string>());
    }

    if (config["path"]) {
      for (const auto &p: config["path"])
        search_path.push_back(expand_home(p.as<std::string>()).string());
    }

    if (const auto &node = config["maven"]; node) {
      if (node["version"])
        maven.version = node["version"].as<std::string>();
      if (node["home"])
        maven.home = expand_home(node["home"].as<std::string>());
      if (node["url"])
        maven.url = node["url"].as<std::string>();
      if (node["plugin"])
        maven.plugin = node["plugin"].as<std::string>();
    }

    if (const auto &node = config["commands"]; node) {
      if (!node.IsMap())
        return std::unexpected(failure{ errc::invalid_configuration, "'commands' must be a map of operation to command list" });

      for (const auto &c: node) {
        const auto operation = c.first.as<std::string>();
        if (!commands.contains(operation))
          return std::unexpected(failure{ errc::invalid_configuration, std::format("Unknown operation '{}' in 'commands'", operation) });

        std::vector<std::string> sequence;
        if (c.second.IsScalar())
          sequence.push_back(c.second.Scalar());
        else
          for (const auto &line: c.second)
            sequence.push_back(line.as<std::string>());
        commands[operation] = std::move(sequence);
      }
    }

    return {};
  } catch (const std::exception &e) {
    spdlog::error("Couldn't read '{}': {}\n", config_file_path.string(), e.what());
    return std::unexpected(failure{ errc::invalid_configuration, std::format("Couldn't read '{}': {}", config_file_path.string(), e.what()) });
  }
}

void configuration::apply_search_path() const
{
  if (search_path.empty())
    return;

  std::string path;
  for (const auto &p: search_path)
    path += std::format("{}{}", p, host_os_path_seperator);
  if (const char *current = std::getenv("PATH"))
    path += current;

#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
  _putenv_s("PATH", path.c_str());
#else
  setenv("PATH", path.c_str(), 1);
#endif
}

const std::vector<std::string> &configuration::commands_for(const std::string &operation) const
{
  static const std::vector<std::string> none;
  const auto it = commands.find(operation);
  return it == commands.end() ? none : it->second;
}

} // namespace bomscan
