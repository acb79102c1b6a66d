#pragma once

#include "bomscan.hpp"
#include "error.hpp"
#include "pipeline.hpp"
#include "report_store.hpp"
#include "nlohmann/json.hpp"
#include "taskflow/taskflow.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bomscan {

enum class job_status { pending, running, completed, failed };
std::string_view to_string(job_status status);

// Snapshot of a job as returned to callers
struct job_view {
  std::string id;
  job_status status = job_status::pending;
  std::optional<std::string> language;
  std::optional<std::string> dependency_manager;
  std::optional<std::string> started_at;
  std::optional<std::string> finished_at;
  std::optional<std::string> error;
  std::optional<fs::path> result_ref;
  std::optional<nlohmann::json> report;
};

nlohmann::json to_json(const job_view &view);

/**
 * @brief Job lifecycle state machine.
 *
 * pending -> running -> completed | failed. A terminal job keeps its id until
 * removed and may be resubmitted. Jobs run on a Taskflow executor; submit never
 * waits for a pipeline. The durable record of a job is written before its
 * terminal state becomes visible.
 */
class job_registry {
public:
  using scan_function = std::function<std::expected<nlohmann::json, failure>(const scan_job &)>;

  job_registry(report_store store, std::size_t workers, scan_function scan);
  ~job_registry();

  job_registry(const job_registry &)            = delete;
  job_registry &operator=(const job_registry &) = delete;

  std::expected<job_view, failure> submit(const std::string &id, const std::string &source);
  std::expected<job_view, failure> poll(const std::string &id) const;
  std::expected<void, failure> remove(const std::string &id);
  std::expected<job_view, failure> cancel(const std::string &id);

  // Blocks until every dispatched job has finished
  void wait_for_all();

  [[nodiscard]] const report_store &get_store() const
  {
    return store;
  }

private:
  using clock = std::chrono::system_clock;

  struct job_record {
    std::string id;
    std::string source;
    job_status status = job_status::pending;
    std::optional<std::string> language;
    std::optional<std::string> dependency_manager;
    std::optional<clock::time_point> started_at;
    std::optional<clock::time_point> finished_at;
    std::optional<std::string> error;
    std::optional<fs::path> result_ref;
    std::stop_source stop;
  };

  static bool is_active(job_status status)
  {
    return status == job_status::pending || status == job_status::running;
  }
  static job_view make_view(const job_record &record);

  void run(const std::string &id);
  void finish(const std::string &id, std::expected<nlohmann::json, failure> outcome);

  report_store store;
  scan_function scan;

  mutable std::mutex mutex;
  std::unordered_map<std::string, job_record> jobs;

  // Declared last so running jobs finish before the table is destroyed
  tf::Executor executor;
};

} // namespace bomscan
