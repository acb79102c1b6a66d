#include "report_store.hpp"
#include "bomscan.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cctype>
#include <format>

namespace bomscan {

report_store::report_store(fs::path root) : root(fs::absolute(std::move(root)))
{
}

bool report_store::is_valid_id(std::string_view id)
{
  if (id.empty() || id == "." || id == "..")
    return false;
  return std::ranges::all_of(id, [](unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '-';
  });
}

fs::path report_store::job_directory(std::string_view id) const
{
  return root / std::string(id);
}

fs::path report_store::report_path(std::string_view id) const
{
  return job_directory(id) / report_filename;
}

fs::path report_store::error_path(std::string_view id) const
{
  return job_directory(id) / error_filename;
}

std::expected<fs::path, failure> report_store::prepare(std::string_view id) const
{
  const auto directory = job_directory(id);
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec)
    return std::unexpected(failure{ errc::io_error, std::format("Cannot create job directory '{}': {}", directory.string(), ec.message()) });
  return directory;
}

std::expected<fs::path, failure> report_store::save_report(std::string_view id, const nlohmann::json &report) const
{
  if (auto directory = prepare(id); !directory)
    return std::unexpected(directory.error());

  const auto destination = report_path(id);
  auto temporary         = destination;
  temporary += ".tmp";

  if (auto result = write_text_file(temporary, report.dump(2)); !result)
    return std::unexpected(result.error());

  std::error_code ec;
  fs::rename(temporary, destination, ec);
  if (ec) {
    fs::remove(temporary, ec);
    return std::unexpected(failure{ errc::io_error, std::format("Cannot write '{}'", destination.string()) });
  }
  return destination;
}

std::expected<fs::path, failure> report_store::save_error(std::string_view id, std::string_view trace) const
{
  if (auto directory = prepare(id); !directory)
    return std::unexpected(directory.error());

  const auto destination = error_path(id);
  if (auto result = write_text_file(destination, trace); !result)
    return std::unexpected(result.error());
  return destination;
}

std::optional<nlohmann::json> report_store::load_report(std::string_view id) const
{
  return try_load_json(report_path(id));
}

std::optional<std::string> report_store::load_error(std::string_view id) const
{
  const auto file = error_path(id);
  std::error_code ec;
  if (!fs::exists(file, ec))
    return std::nullopt;

  auto content = read_text_file(file);
  if (!content) {
    spdlog::error("{}", content.error().describe());
    return std::nullopt;
  }
  return *content;
}

std::expected<void, failure> report_store::clear_outcome(std::string_view id) const
{
  std::error_code ec;
  for (const auto &file: { report_path(id), error_path(id) }) {
    fs::remove(file, ec);
    if (ec)
      return std::unexpected(failure{ errc::io_error, std::format("Cannot remove '{}': {}", file.string(), ec.message()) });
  }
  return {};
}

std::expected<void, failure> report_store::erase(std::string_view id) const
{
  const auto directory = job_directory(id);
  std::error_code ec;
  fs::remove_all(directory, ec);
  if (ec)
    return std::unexpected(failure{ errc::io_error, std::format("Cannot remove '{}': {}", directory.string(), ec.message()) });
  return {};
}

} // namespace bomscan
