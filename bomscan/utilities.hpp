#pragma once

#include "bomscan.hpp"
#include "error.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace bomscan {

struct exec_options {
  fs::path working_directory;              // must be absolute, never inherited from the process
  fs::path log_file;                       // stdout and stderr of the command are written here
  std::chrono::milliseconds timeout{ 0 };  // zero disables the timeout
  std::stop_token stop;
};

// Runs a shell command. Returns the captured output and exit code, or timeout / cancelled.
std::expected<process_return, failure> exec(const std::string &command_text, const std::string &arg_text, const exec_options &options);

// Splits "url@branch" into url and branch. The branch separator must follow the last '/'.
std::pair<std::string, std::string> split_source_reference(std::string_view source_reference);
std::string repository_name_from_url(std::string_view url);

// Source references end up on a shell command line. Rejects shell metacharacters,
// option-like urls and branch names git would refuse. Errors are fetch_error.
std::expected<void, failure> validate_source_reference(std::string_view url, std::string_view branch);

std::optional<fs::path> find_executable(std::string_view name);

std::string format_timestamp(std::chrono::system_clock::time_point time);
std::string now_iso();

std::expected<std::string, failure> read_text_file(const fs::path &path);
std::expected<void, failure> write_text_file(const fs::path &path, std::string_view content);

// Parsed JSON content of a file, or nullopt if it is absent or does not parse
std::optional<nlohmann::json> try_load_json(const fs::path &path);
} // namespace bomscan
