#include "language_detector.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace bomscan {

namespace {
// Order is the tie-break order
const std::array<std::pair<std::string, std::string>, 3> language_extensions = { {
  { "Python", ".py" },
  { "Java", ".java" },
  { "Go", ".go" },
} };

std::string to_lower(std::string text)
{
  std::ranges::transform(text, text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

struct directory_listing {
  fs::path directory;
  std::vector<std::string> files; // lower case
};

/**
 * @brief Visits directories top-down (a directory's files before its subdirectories).
 *        Stops when the visitor returns a value.
 */
std::optional<std::string> walk(const fs::path &directory, const std::function<std::optional<std::string>(const directory_listing &)> &visitor)
{
  directory_listing listing{ directory, {} };
  std::vector<fs::path> subdirectories;

  std::error_code ec;
  for (const auto &entry: fs::directory_iterator(directory, fs::directory_options::skip_permission_denied, ec)) {
    const auto name = entry.path().filename().string();
    if (entry.is_directory(ec)) {
      if (name != ".git")
        subdirectories.push_back(entry.path());
    } else {
      listing.files.push_back(to_lower(name));
    }
  }
  std::ranges::sort(subdirectories);

  if (auto result = visitor(listing))
    return result;

  for (const auto &d: subdirectories) {
    if (auto result = walk(d, visitor))
      return result;
  }
  return std::nullopt;
}

bool has_file(const directory_listing &listing, std::string_view name)
{
  return std::ranges::find(listing.files, name) != listing.files.end();
}

std::string pyproject_manager(const fs::path &pyproject)
{
  std::ifstream file(pyproject);
  std::string line;
  while (std::getline(file, line)) {
    if (line.starts_with("[tool.poetry"))
      return "poetry";
    if (line.starts_with("[tool.uv"))
      return "uv";
    if (line.starts_with("[tool.flit"))
      return "flit";
  }
  return "pyproject";
}
} // namespace

std::string detect_language(const fs::path &repository)
{
  std::array<std::size_t, language_extensions.size()> counts{};

  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(repository, fs::directory_options::skip_permission_denied, ec); it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    if (it->is_directory(ec) && it->path().filename() == ".git") {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(ec))
      continue;
    const auto extension = it->path().extension().string();
    for (std::size_t i = 0; i < language_extensions.size(); ++i)
      if (extension == language_extensions[i].second)
        ++counts[i];
  }

  const auto best = std::ranges::max_element(counts);
  if (*best == 0)
    return unknown_language;
  return language_extensions[std::distance(counts.begin(), best)].first;
}

std::string detect_dependency_manager(const fs::path &repository, const std::string &language)
{
  std::optional<std::string> manager;

  if (language == "Python") {
    manager = walk(repository, [](const directory_listing &listing) -> std::optional<std::string> {
      if (has_file(listing, "poetry.lock"))
        return "poetry";
      if (has_file(listing, "uv.lock"))
        return "uv";
      if (has_file(listing, "pipfile.lock"))
        return "pipenv";
      if (has_file(listing, "requirements.txt"))
        return "pip";
      if (has_file(listing, "pipfile"))
        return "pipenv";
      if (has_file(listing, "setup.py"))
        return "setuptools";
      if (has_file(listing, "pyproject.toml"))
        return pyproject_manager(listing.directory / "pyproject.toml");
      return std::nullopt;
    });
  } else if (language == "Java") {
    manager = walk(repository, [](const directory_listing &listing) -> std::optional<std::string> {
      if (has_file(listing, "pom.xml"))
        return "maven";
      if (has_file(listing, "build.gradle"))
        return "gradle";
      return std::nullopt;
    });
  } else if (language == "Go") {
    manager = walk(repository, [](const directory_listing &listing) -> std::optional<std::string> {
      if (has_file(listing, "go.mod"))
        return "go modules";
      return std::nullopt;
    });
  }

  return manager.value_or(unknown_manager);
}

detection detect_ecosystem(const fs::path &repository)
{
  auto language = detect_language(repository);
  auto manager  = detect_dependency_manager(repository, language);
  spdlog::info("Detected language '{}' with dependency manager '{}'", language, manager);
  return { std::move(language), std::move(manager) };
}

} // namespace bomscan
