#include "dependency_set.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cctype>
#include <format>

namespace bomscan {

namespace {
bool is_blank(std::string_view content)
{
  return std::ranges::all_of(content, [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

std::optional<std::string> string_field(const json &node, const std::string &key)
{
  const auto it = node.find(key);
  if (it == node.end() || !it->is_string())
    return std::nullopt;
  auto value = it->get<std::string>();
  if (value.empty())
    return std::nullopt;
  return value;
}

std::optional<std::string> pipdeptree_identifier(const json &node)
{
  if (!node.is_object())
    return std::nullopt;

  auto name = string_field(node, "package_name");
  if (!name)
    name = string_field(node, "key");
  const auto version = string_field(node, "installed_version");
  if (!name || !version)
    return std::nullopt;

  return std::format("{}@{}", *name, *version);
}

// --json-tree nests dependencies recursively; every node becomes a package entry
void flatten_pipdeptree_node(const json &node, json &packages)
{
  const auto identifier = pipdeptree_identifier(node);
  if (!identifier)
    return;

  json package = { { "name", *identifier }, { "children", json::array() } };
  const auto dependencies = node.find("dependencies");
  if (dependencies != node.end() && dependencies->is_array()) {
    for (const auto &d: *dependencies) {
      if (auto child = pipdeptree_identifier(d))
        package["children"].push_back(*child);
    }
  }
  packages.push_back(std::move(package));

  if (dependencies != node.end() && dependencies->is_array()) {
    for (const auto &d: *dependencies)
      flatten_pipdeptree_node(d, packages);
  }
}
} // namespace

dependency_set::dependency_set(std::initializer_list<value_type> initial_entries)
{
  for (const auto &[name, version]: initial_entries)
    insert(name, version);
}

void dependency_set::insert(std::string name, std::string version)
{
  if (auto it = index.find(name); it != index.end()) {
    entries[it->second].second = std::move(version);
    return;
  }
  index.emplace(name, entries.size());
  entries.emplace_back(std::move(name), std::move(version));
}

const std::string *dependency_set::find(std::string_view name) const noexcept
{
  const auto it = index.find(std::string{ name });
  if (it == index.end())
    return nullptr;
  return &entries[it->second].second;
}

std::optional<std::pair<std::string, std::string>> split_identifier(std::string_view identifier)
{
  const auto at = identifier.rfind('@');
  if (at == std::string_view::npos)
    return std::nullopt;
  return std::pair{ std::string{ identifier.substr(0, at) }, std::string{ identifier.substr(at + 1) } };
}

std::expected<dependency_set, failure> parse_dependency_tree(std::string_view content)
{
  if (is_blank(content))
    return std::unexpected(failure{ errc::empty_input, "dependency tree is empty" });

  // The tree renderer may print log lines before the document
  const auto start = content.find('{');
  if (start == std::string_view::npos)
    return std::unexpected(failure{ errc::malformed_input, "no JSON object found in dependency tree" });

  json data;
  try {
    data = json::parse(content.substr(start));
  } catch (const json::parse_error &e) {
    return std::unexpected(failure{ errc::malformed_input, std::format("invalid JSON in dependency tree: {}", e.what()) });
  }

  if (!data.is_object() || !data.contains("packages"))
    return std::unexpected(failure{ errc::malformed_input, "unexpected dependency tree format, expected {\"packages\": [...]}" });
  if (!data["packages"].is_array())
    return std::unexpected(failure{ errc::malformed_input, "\"packages\" is not an array" });

  dependency_set dependencies;
  const auto add_identifier = [&](const json &node) {
    if (!node.is_string())
      return;
    if (auto pair = split_identifier(node.get<std::string>()))
      dependencies.insert(std::move(pair->first), std::move(pair->second));
  };

  for (const auto &package: data["packages"]) {
    if (!package.is_object())
      continue;
    if (auto name = package.find("name"); name != package.end())
      add_identifier(*name);
    if (auto children = package.find("children"); children != package.end() && children->is_array()) {
      for (const auto &child: *children)
        add_identifier(child);
    }
  }

  return dependencies;
}

std::expected<dependency_set, failure> load_dependency_tree(const path &file)
{
  auto content = read_text_file(file);
  if (!content)
    return std::unexpected(content.error());

  auto result = parse_dependency_tree(*content);
  if (!result)
    return std::unexpected(failure{ result.error().code, std::format("{}: {}", file.string(), result.error().message) });
  return result;
}

std::expected<dependency_set, failure> parse_sbom_components(std::string_view content)
{
  if (is_blank(content))
    return std::unexpected(failure{ errc::empty_input, "SBOM is empty" });

  json data;
  try {
    data = json::parse(content);
  } catch (const json::parse_error &e) {
    return std::unexpected(failure{ errc::malformed_input, std::format("invalid JSON in SBOM: {}", e.what()) });
  }

  if (!data.is_object())
    return std::unexpected(failure{ errc::malformed_input, "SBOM is not a JSON object" });

  dependency_set dependencies;
  const auto components = data.find("components");
  if (components == data.end() || components->is_null())
    return dependencies;
  if (!components->is_array())
    return std::unexpected(failure{ errc::malformed_input, "\"components\" is not an array" });

  for (const auto &component: *components) {
    if (!component.is_object())
      continue;
    auto name    = string_field(component, "name");
    auto version = string_field(component, "version");
    if (name && version)
      dependencies.insert(std::move(*name), std::move(*version));
  }

  return dependencies;
}

std::expected<dependency_set, failure> load_sbom_components(const path &file)
{
  auto content = read_text_file(file);
  if (!content)
    return std::unexpected(content.error());

  auto result = parse_sbom_components(*content);
  if (!result)
    return std::unexpected(failure{ result.error().code, std::format("{}: {}", file.string(), result.error().message) });
  return result;
}

std::expected<json, failure> normalize_manifest(const json &manifest)
{
  if (manifest.is_object() && manifest.contains("packages"))
    return manifest;

  if (!manifest.is_array())
    return std::unexpected(failure{ errc::malformed_input, "dependency manifest is not a pipdeptree listing" });

  json packages = json::array();
  for (const auto &entry: manifest) {
    if (!entry.is_object())
      continue;

    // pipdeptree --json: {"package": {...}, "dependencies": [{...}]}
    if (auto package = entry.find("package"); package != entry.end() && package->is_object()) {
      const auto identifier = pipdeptree_identifier(*package);
      if (!identifier)
        continue;
      json node = { { "name", *identifier }, { "children", json::array() } };
      if (auto dependencies = entry.find("dependencies"); dependencies != entry.end() && dependencies->is_array()) {
        for (const auto &d: *dependencies) {
          if (auto child = pipdeptree_identifier(d))
            node["children"].push_back(*child);
        }
      }
      packages.push_back(std::move(node));
      continue;
    }

    flatten_pipdeptree_node(entry, packages);
  }

  spdlog::debug("Normalized {} manifest packages", packages.size());
  return json{ { "packages", std::move(packages) } };
}

} // namespace bomscan
