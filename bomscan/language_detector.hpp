#pragma once

#include "bomscan.hpp"
#include <filesystem>
#include <string>

namespace bomscan {

// Language with the most source files under the repository, or "Unknown"
std::string detect_language(const std::filesystem::path &repository);

// Dependency manager for the language, searching directories top-down, lock files before manifests
std::string detect_dependency_manager(const std::filesystem::path &repository, const std::string &language);

detection detect_ecosystem(const std::filesystem::path &repository);

} // namespace bomscan
