#pragma once

#include <string>
#include <string_view>

namespace bomscan {
const std::string report_filename              = "report.json";
const std::string error_filename               = "error.txt";
const std::string job_log_filename             = "job.log";
const std::string default_config_filename      = "bomscan.yaml";
const std::string default_jobs_directory       = "jobs";
const std::string environment_directory_name   = "sbom-env";
const std::string python_dependency_files[]    = { "all-dep.txt", "a.txt" };
const std::string python_resolver_tree         = "dets.json";
const std::string normalized_manifest_filename = "normalized_deps.json";
const std::string comparison_filename          = "comparison.txt";

#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
const std::string host_os_string         = "windows";
const std::string executable_extension   = ".exe";
const std::string host_os_path_seperator = ";";
#elif defined(__APPLE__)
const std::string host_os_string         = "macos";
const std::string executable_extension   = "";
const std::string host_os_path_seperator = ":";
#elif defined(__linux__)
const std::string host_os_string         = "linux";
const std::string executable_extension   = "";
const std::string host_os_path_seperator = ":";
#endif

struct process_return {
  std::string result;
  int retcode;
};

// Language and dependency manager of a checked out repository
struct detection {
  std::string language;
  std::string manager;
};

const std::string unknown_language = "Unknown";
const std::string unknown_manager  = "Unknown";
} // namespace bomscan
