#include "bomscan.hpp"
#include "configuration.hpp"
#include "job_registry.hpp"
#include "language_detector.hpp"
#include "pipeline.hpp"
#include "reconciliation.hpp"
#include "report_store.hpp"
#include "service.hpp"
#include "toolchain.hpp"
#include "utilities.hpp"
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "semver.hpp"
#include <chrono>
#include <iostream>

static const semver::version bomscan_version{ 1, 0, 0 };

static int print_view(const std::expected<bomscan::job_view, bomscan::failure> &view)
{
  if (!view) {
    std::cout << bomscan::error_response(nullptr, view.error()).dump(2) << "\n";
    return -1;
  }
  std::cout << bomscan::to_json(*view).dump(2) << "\n";
  return view->status == bomscan::job_status::failed ? -1 : 0;
}

int main(int argc, char **argv)
{
  // Setup logging
  std::error_code error_code;
  fs::remove("bomscan.log", error_code);

  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_log;
  try {
    file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>("bomscan.log", true);
  } catch (const spdlog::spdlog_ex &) {
    try {
      auto time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
      file_log  = std::make_shared<spdlog::sinks::basic_file_sink_mt>("bomscan-" + std::to_string(time) + ".log", true);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open bomscan.log: " << e.what() << "\n";
      return -1;
    }
  }
  file_log->set_level(spdlog::level::trace);

  auto bomscanlog = std::make_shared<spdlog::logger>("bomscanlog", spdlog::sinks_init_list{ console_error, file_log });
  bomscanlog->set_level(spdlog::level::trace);
  spdlog::set_default_logger(bomscanlog);

  cxxopts::Options options("bomscan", "SBOM generation, scanning and dependency reconciliation. Ver " + bomscan_version.to_string());
  options.allow_unrecognised_options();
  options.positional_help("<action> [optional args]");
  // clang-format off
  options.add_options()("h,help", "Print usage")
                       ("c,config", "Configuration file", cxxopts::value<std::string>()->default_value(bomscan::default_config_filename))
                       ("jobs", "Jobs directory", cxxopts::value<std::string>())
                       ("w,workers", "Number of concurrent jobs", cxxopts::value<int>())
                       ("t,timeout", "Per command timeout in seconds, 0 disables", cxxopts::value<int>())
                       ("o,output", "Output file for 'compare'", cxxopts::value<std::string>())
                       ("v,verbose", "Print progress to the console", cxxopts::value<bool>()->default_value("false"))
                       ("action", "Select from 'serve', 'scan', 'report', 'delete', 'compare' or 'detect'", cxxopts::value<std::string>());
  // clang-format on

  options.parse_positional({ "action" });
  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const cxxopts::exceptions::exception &e) {
    spdlog::error("{}", e.what());
    return -1;
  }

  if (result.count("help") || !result.count("action")) {
    std::cout << options.help() << std::endl;
    return 0;
  }

  if (result["verbose"].as<bool>())
    console_error->set_level(spdlog::level::info);

  bomscan::configuration config;
  if (auto loaded = config.load_config_file(result["config"].as<std::string>()); !loaded) {
    spdlog::error("{}", loaded.error().describe());
    return -1;
  }
  if (result.count("jobs"))
    config.jobs_path = fs::absolute(result["jobs"].as<std::string>());
  if (result.count("workers")) {
    if (result["workers"].as<int>() < 1) {
      spdlog::error("--workers must be at least 1");
      return -1;
    }
    config.workers = static_cast<std::size_t>(result["workers"].as<int>());
  }
  if (result.count("timeout")) {
    if (result["timeout"].as<int>() < 0) {
      spdlog::error("--timeout cannot be negative");
      return -1;
    }
    config.stage_timeout = std::chrono::seconds(result["timeout"].as<int>());
  }
  file_log->set_level(config.log_level);
  config.apply_search_path();

  const auto action = result["action"].as<std::string>();
  const auto &args  = result.unmatched();

  if (action == "detect") {
    if (args.size() != 1) {
      spdlog::error("Usage: bomscan detect <path>");
      return -1;
    }
    const auto detected = bomscan::detect_ecosystem(args[0]);
    std::cout << "language: " << detected.language << "\nmanager: " << detected.manager << "\n";
    return 0;
  }

  if (action == "compare") {
    if (args.size() != 2) {
      spdlog::error("Usage: bomscan compare <tree.json> <sbom.json> [-o file]");
      return -1;
    }
    const auto outcome = bomscan::reconcile_files(args[0], args[1]);
    if (!outcome) {
      spdlog::error("Reconciliation unavailable: {}", outcome.error().reason.describe());
      return -1;
    }
    const auto rendered = bomscan::render_report(*outcome);
    if (result.count("output")) {
      if (auto written = bomscan::write_text_file(result["output"].as<std::string>(), rendered); !written) {
        spdlog::error("{}", written.error().describe());
        return -1;
      }
    } else {
      std::cout << rendered;
    }
    return 0;
  }

  bomscan::process_toolchain tools(config);
  const bomscan::stage_router router;
  bomscan::job_registry registry(bomscan::report_store{ config.jobs_path }, config.workers, [&](const bomscan::scan_job &job) {
    return bomscan::run_scan_pipeline(job, tools, router);
  });

  if (action == "serve") {
    spdlog::info("Serving requests on stdin, jobs in {}", config.jobs_path.string());
    bomscan::service server(registry);
    server.serve(std::cin, std::cout);
    registry.wait_for_all();
    return 0;
  } else if (action == "scan") {
    if (args.size() != 2) {
      spdlog::error("Usage: bomscan scan <id> <source>");
      return -1;
    }
    if (auto submitted = registry.submit(args[0], args[1]); !submitted)
      return print_view(submitted);
    registry.wait_for_all();
    return print_view(registry.poll(args[0]));
  } else if (action == "report") {
    if (args.size() != 1) {
      spdlog::error("Usage: bomscan report <id>");
      return -1;
    }
    return print_view(registry.poll(args[0]));
  } else if (action == "delete") {
    if (args.size() != 1) {
      spdlog::error("Usage: bomscan delete <id>");
      return -1;
    }
    if (auto removed = registry.remove(args[0]); !removed) {
      spdlog::error("{}", removed.error().describe());
      return -1;
    }
    std::cout << "Deleted " << args[0] << "\n";
    return 0;
  }

  std::cout << options.help() << std::endl;
  return -1;
}
