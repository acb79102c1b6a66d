#pragma once

#include "dependency_set.hpp"
#include "error.hpp"
#include "nlohmann/json.hpp"
#include <expected>
#include <string>
#include <vector>

namespace bomscan {

struct dependency {
  std::string name;
  std::string version;

  bool operator==(const dependency &) const = default;
};

struct version_mismatch {
  std::string name;
  std::string tree_version;
  std::string sbom_version;

  bool operator==(const version_mismatch &) const = default;
};

/**
 * @brief Classification of every dependency of a resolver view (A) and an SBOM view (B).
 *        The four lists partition (A\B), (A n B) and (B\A) without overlap.
 */
struct reconciliation_result {
  std::vector<dependency> missing_in_sbom;
  std::vector<version_mismatch> version_mismatches;
  std::vector<dependency> same;
  std::vector<dependency> extra_in_sbom;
};

// Reason a reconciliation could not be produced; recorded in the report instead of failing the job
struct reconciliation_unavailable {
  failure reason;
};

using reconciliation_outcome = std::expected<reconciliation_result, reconciliation_unavailable>;

reconciliation_result reconcile(const dependency_set &tree, const dependency_set &sbom);

// Loads both views and reconciles them. Input problems become reconciliation_unavailable.
reconciliation_outcome reconcile_files(const path &tree_file, const path &sbom_file);

std::string render_report(const reconciliation_result &result);
nlohmann::json to_json(const reconciliation_result &result);
nlohmann::json to_json(const reconciliation_outcome &outcome);

} // namespace bomscan
