#pragma once

#include "error.hpp"
#include "yaml-cpp/yaml.h"
#include "spdlog/spdlog.h"
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace bomscan {

struct maven_settings {
  std::string version = "3.9.9";
  fs::path home;
  std::string url    = "https://archive.apache.org/dist/maven/maven-3/{{ version }}/binaries/apache-maven-{{ version }}-bin.zip";
  std::string plugin = "org.cyclonedx:cyclonedx-maven-plugin:2.9.1:makeAggregateBom";
};

// Sequence of command templates per toolchain operation
using command_table = std::map<std::string, std::vector<std::string>>;

class configuration {
public:
  configuration();

  std::expected<void, failure> load_config_file(const fs::path &config_file_path);
  void apply_search_path() const;

  [[nodiscard]] const std::vector<std::string> &commands_for(const std::string &operation) const;

  fs::path jobs_path;
  fs::path tools_home;
  std::size_t workers = 4;
  std::chrono::seconds stage_timeout{ 0 };
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::vector<std::string> search_path;
  maven_settings maven;
  command_table commands;
};

command_table default_commands();

} // namespace bomscan
