#pragma once

#include "error.hpp"
#include "nlohmann/json.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace bomscan {

/**
 * @brief Durable per-job records under <root>/<id>/.
 *
 * A completed job has report.json, a failed job has error.txt. Both can be
 * read back without any in-memory state.
 */
class report_store {
public:
  explicit report_store(fs::path root);

  // Ids must be usable as a single directory name
  static bool is_valid_id(std::string_view id);

  [[nodiscard]] fs::path job_directory(std::string_view id) const;
  [[nodiscard]] fs::path report_path(std::string_view id) const;
  [[nodiscard]] fs::path error_path(std::string_view id) const;
  [[nodiscard]] const fs::path &get_root() const
  {
    return root;
  }

  std::expected<fs::path, failure> prepare(std::string_view id) const;
  std::expected<fs::path, failure> save_report(std::string_view id, const nlohmann::json &report) const;
  std::expected<fs::path, failure> save_error(std::string_view id, std::string_view trace) const;

  [[nodiscard]] std::optional<nlohmann::json> load_report(std::string_view id) const;
  [[nodiscard]] std::optional<std::string> load_error(std::string_view id) const;

  // Removes report and error of a previous run so a new run starts clean
  std::expected<void, failure> clear_outcome(std::string_view id) const;
  std::expected<void, failure> erase(std::string_view id) const;

private:
  fs::path root;
};

} // namespace bomscan
