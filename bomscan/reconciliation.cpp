#include "reconciliation.hpp"
#include <format>

namespace bomscan {

namespace {
std::string identifier(const dependency &d)
{
  return std::format("{}@{}", d.name, d.version);
}

std::string describe(const version_mismatch &m)
{
  return std::format("{} (deptree: {}, sbom: {})", m.name, m.tree_version, m.sbom_version);
}

template<typename T, typename F> void render_section(std::string &output, std::string_view title, const std::vector<T> &items, F &&format_item)
{
  output += std::format("=== {} ===\n", title);
  if (items.empty()) {
    output += "None\n";
    return;
  }
  for (const auto &i: items)
    output += format_item(i) + "\n";
}
} // namespace

reconciliation_result reconcile(const dependency_set &tree, const dependency_set &sbom)
{
  reconciliation_result result;

  for (const auto &[name, version]: tree) {
    const auto *sbom_version = sbom.find(name);
    if (sbom_version == nullptr)
      result.missing_in_sbom.push_back({ name, version });
    else if (*sbom_version != version)
      result.version_mismatches.push_back({ name, version, *sbom_version });
    else
      result.same.push_back({ name, version });
  }

  for (const auto &[name, version]: sbom) {
    if (!tree.contains(name))
      result.extra_in_sbom.push_back({ name, version });
  }

  return result;
}

reconciliation_outcome reconcile_files(const path &tree_file, const path &sbom_file)
{
  auto tree = load_dependency_tree(tree_file);
  if (!tree)
    return std::unexpected(reconciliation_unavailable{ tree.error() });

  auto sbom = load_sbom_components(sbom_file);
  if (!sbom)
    return std::unexpected(reconciliation_unavailable{ sbom.error() });

  return reconcile(*tree, *sbom);
}

std::string render_report(const reconciliation_result &result)
{
  std::string output;
  render_section(output, "Dependencies missing in SBOM", result.missing_in_sbom, identifier);
  output += "\n";
  render_section(output, "Version mismatches", result.version_mismatches, describe);
  output += "\n";
  render_section(output, "Dependencies same in both", result.same, identifier);
  output += "\n";
  render_section(output, "Extra dependencies in SBOM (not in deptree)", result.extra_in_sbom, identifier);
  return output;
}

nlohmann::json to_json(const reconciliation_result &result)
{
  nlohmann::json output = {
    { "missing_in_sbom", nlohmann::json::array() },
    { "version_mismatch", nlohmann::json::array() },
    { "same", nlohmann::json::array() },
    { "extra_in_sbom", nlohmann::json::array() },
  };

  for (const auto &d: result.missing_in_sbom)
    output["missing_in_sbom"].push_back(identifier(d));
  for (const auto &m: result.version_mismatches)
    output["version_mismatch"].push_back({ { "name", m.name }, { "deptree", m.tree_version }, { "sbom", m.sbom_version } });
  for (const auto &d: result.same)
    output["same"].push_back(identifier(d));
  for (const auto &d: result.extra_in_sbom)
    output["extra_in_sbom"].push_back(identifier(d));

  return output;
}

nlohmann::json to_json(const reconciliation_outcome &outcome)
{
  if (outcome) {
    auto output         = to_json(*outcome);
    output["available"] = true;
    return output;
  }

  return {
    { "available", false },
    { "kind", std::string{ errc_name(outcome.error().reason.code) } },
    { "reason", outcome.error().reason.message },
  };
}

} // namespace bomscan
