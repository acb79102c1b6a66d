#pragma once

#include "error.hpp"
#include "nlohmann/json.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bomscan {

using json = nlohmann::json;
using std::filesystem::path;

/**
 * @brief Normalized mapping from dependency name to resolved version.
 *
 * Names are case sensitive. Inserting an existing name replaces its version
 * (last write wins) but keeps the position of the first insertion, so
 * iteration order is the order in which names were first seen.
 */
class dependency_set {
public:
  using value_type     = std::pair<std::string, std::string>;
  using const_iterator = std::vector<value_type>::const_iterator;

  dependency_set() = default;
  dependency_set(std::initializer_list<value_type> entries);

  void insert(std::string name, std::string version);

  [[nodiscard]] const std::string *find(std::string_view name) const noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept
  {
    return find(name) != nullptr;
  }

  [[nodiscard]] std::size_t size() const noexcept
  {
    return entries.size();
  }
  [[nodiscard]] bool empty() const noexcept
  {
    return entries.empty();
  }
  [[nodiscard]] const_iterator begin() const noexcept
  {
    return entries.begin();
  }
  [[nodiscard]] const_iterator end() const noexcept
  {
    return entries.end();
  }

private:
  std::vector<value_type> entries;
  std::unordered_map<std::string, std::size_t> index;
};

// Splits "name@version" at the last '@'. Returns nullopt if there is no '@'.
std::optional<std::pair<std::string, std::string>> split_identifier(std::string_view identifier);

// Resolver tree: {"packages": [{"name": "a@1", "children": ["b@2"]}]}, possibly preceded by log output
std::expected<dependency_set, failure> parse_dependency_tree(std::string_view content);
std::expected<dependency_set, failure> load_dependency_tree(const path &file);

// SBOM component list: {"components": [{"name": "a", "version": "1"}]}
std::expected<dependency_set, failure> parse_sbom_components(std::string_view content);
std::expected<dependency_set, failure> load_sbom_components(const path &file);

// Converts pipdeptree output (--json or --json-tree) into the resolver tree document
std::expected<json, failure> normalize_manifest(const json &manifest);

} // namespace bomscan
