#include "job_registry.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <format>

namespace bomscan {

namespace {
std::atomic<std::uint64_t> job_logger_sequence{ 0 };

std::shared_ptr<spdlog::logger> create_job_logger(const std::string &id, const fs::path &job_directory)
{
  const auto name = std::format("job-{}-{}", id, ++job_logger_sequence);
  try {
    auto log = spdlog::basic_logger_mt(name, (job_directory / job_log_filename).string(), true);
    log->set_level(spdlog::level::trace);
    log->flush_on(spdlog::level::info);
    return log;
  } catch (const spdlog::spdlog_ex &e) {
    spdlog::warn("Cannot open job log for '{}': {}", id, e.what());
    return nullptr;
  }
}
} // namespace

std::string_view to_string(job_status status)
{
  switch (status) {
    case job_status::pending:
      return "pending";
    case job_status::running:
      return "running";
    case job_status::completed:
      return "completed";
    case job_status::failed:
      return "failed";
  }
  return "unknown";
}

nlohmann::json to_json(const job_view &view)
{
  nlohmann::json j = {
    { "id", view.id },
    { "status", std::string(to_string(view.status)) },
  };
  const auto optional_field = [&](const char *key, const std::optional<std::string> &value) {
    j[key] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
  };
  optional_field("language", view.language);
  optional_field("dependency_manager", view.dependency_manager);
  optional_field("started_at", view.started_at);
  optional_field("finished_at", view.finished_at);
  optional_field("error", view.error);
  j["result_ref"] = view.result_ref ? nlohmann::json(view.result_ref->string()) : nlohmann::json(nullptr);
  j["report"]     = view.report ? *view.report : nlohmann::json(nullptr);
  return j;
}

job_registry::job_registry(report_store store, std::size_t workers, scan_function scan)
    : store(std::move(store)), scan(std::move(scan)), executor(std::max<std::size_t>(1, workers))
{
}

job_registry::~job_registry()
{
  executor.wait_for_all();
}

job_view job_registry::make_view(const job_record &record)
{
  job_view view;
  view.id                 = record.id;
  view.status             = record.status;
  view.language           = record.language;
  view.dependency_manager = record.dependency_manager;
  if (record.started_at)
    view.started_at = format_timestamp(*record.started_at);
  if (record.finished_at)
    view.finished_at = format_timestamp(*record.finished_at);
  view.error      = record.error;
  view.result_ref = record.result_ref;
  return view;
}

std::expected<job_view, failure> job_registry::submit(const std::string &id, const std::string &source)
{
  if (!report_store::is_valid_id(id))
    return std::unexpected(failure{ errc::invalid_job_id, std::format("'{}' cannot be used as a job id", id) });

  job_view view;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto it = jobs.find(id); it != jobs.end() && is_active(it->second.status))
      return std::unexpected(failure{ errc::conflict, std::format("Job '{}' is already {}", id, to_string(it->second.status)) });

    job_record record;
    record.id     = id;
    record.source = source;
    jobs.insert_or_assign(id, std::move(record));
    view = make_view(jobs.at(id));
  }

  spdlog::info("Job '{}' submitted for {}", id, source);
  executor.silent_async([this, id]() {
    run(id);
  });
  return view;
}

std::expected<job_view, failure> job_registry::poll(const std::string &id) const
{
  std::optional<job_view> in_memory;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto it = jobs.find(id); it != jobs.end())
      in_memory = make_view(it->second);
  }

  // Completed reports stay on disk only
  if (in_memory) {
    if (in_memory->status == job_status::completed) {
      in_memory->report = store.load_report(id);
      if (!in_memory->report)
        spdlog::warn("Report of job '{}' could not be read from {}", id, store.report_path(id).string());
    }
    return *in_memory;
  }

  if (!report_store::is_valid_id(id))
    return std::unexpected(failure{ errc::not_found, std::format("No job '{}'", id) });

  // Not in memory, e.g. after a restart
  if (auto report = store.load_report(id)) {
    job_view view;
    view.id         = id;
    view.status     = job_status::completed;
    view.result_ref = store.report_path(id);
    if (report->contains("artifacts")) {
      const auto &artifacts = (*report)["artifacts"];
      if (artifacts.contains("language") && artifacts["language"].is_string())
        view.language = artifacts["language"].get<std::string>();
      if (artifacts.contains("dependency_manager") && artifacts["dependency_manager"].is_string())
        view.dependency_manager = artifacts["dependency_manager"].get<std::string>();
    }
    if (report->contains("generated_at") && (*report)["generated_at"].is_string())
      view.finished_at = (*report)["generated_at"].get<std::string>();
    view.report = std::move(*report);
    return view;
  }

  if (auto trace = store.load_error(id)) {
    job_view view;
    view.id     = id;
    view.status = job_status::failed;
    view.error  = std::move(*trace);
    return view;
  }

  return std::unexpected(failure{ errc::not_found, std::format("No job '{}'", id) });
}

std::expected<void, failure> job_registry::remove(const std::string &id)
{
  if (!report_store::is_valid_id(id))
    return std::unexpected(failure{ errc::invalid_job_id, std::format("'{}' cannot be used as a job id", id) });

  std::lock_guard<std::mutex> lock(mutex);
  if (auto it = jobs.find(id); it != jobs.end()) {
    if (is_active(it->second.status))
      return std::unexpected(failure{ errc::invalid_state, std::format("Job '{}' is {}", id, to_string(it->second.status)) });
    jobs.erase(it);
  }

  if (auto erased = store.erase(id); !erased)
    return erased;

  spdlog::info("Job '{}' removed", id);
  return {};
}

std::expected<job_view, failure> job_registry::cancel(const std::string &id)
{
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto it = jobs.find(id); it != jobs.end()) {
      if (!is_active(it->second.status))
        return std::unexpected(failure{ errc::invalid_state, std::format("Job '{}' is {}", id, to_string(it->second.status)) });

      it->second.stop.request_stop();
      spdlog::info("Job '{}' cancellation requested", id);
      return make_view(it->second);
    }
  }

  // A durable record means the job finished in an earlier run
  std::error_code ec;
  if (report_store::is_valid_id(id) && (fs::exists(store.report_path(id), ec) || fs::exists(store.error_path(id), ec)))
    return std::unexpected(failure{ errc::invalid_state, std::format("Job '{}' already finished", id) });
  return std::unexpected(failure{ errc::not_found, std::format("No job '{}'", id) });
}

void job_registry::wait_for_all()
{
  executor.wait_for_all();
}

void job_registry::run(const std::string &id)
{
  scan_job job;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = jobs.find(id);
    if (it == jobs.end())
      return;
    it->second.status     = job_status::running;
    it->second.started_at = clock::now();
    job.id                = id;
    job.source            = it->second.source;
    job.stop              = it->second.stop.get_token();
  }

  const auto job_directory = store.prepare(id);
  if (!job_directory) {
    finish(id, std::unexpected(job_directory.error()));
    return;
  }
  if (auto cleared = store.clear_outcome(id); !cleared) {
    finish(id, std::unexpected(cleared.error()));
    return;
  }

  job.job_directory = *job_directory;
  job.log           = create_job_logger(id, *job_directory);
  job.on_detected   = [this, id](const detection &detected) {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto it = jobs.find(id); it != jobs.end()) {
      it->second.language           = detected.language;
      it->second.dependency_manager = detected.manager;
    }
  };

  std::expected<nlohmann::json, failure> outcome;
  if (job.stop.stop_requested()) {
    outcome = std::unexpected(failure{ errc::cancelled, "Cancelled before the job started" });
  } else {
    try {
      outcome = scan(job);
    } catch (const std::exception &e) {
      outcome = std::unexpected(failure{ errc::io_error, std::format("Unhandled exception: {}", e.what()) });
    }
  }

  if (job.log) {
    if (outcome)
      job.log->info("Job completed");
    else
      job.log->error("Job failed: {}", outcome.error().describe());
    job.log->flush();
    spdlog::drop(job.log->name());
  }

  finish(id, std::move(outcome));
}

void job_registry::finish(const std::string &id, std::expected<nlohmann::json, failure> outcome)
{
  std::optional<fs::path> result_ref;
  if (outcome) {
    auto saved = store.save_report(id, *outcome);
    if (saved)
      result_ref = *saved;
    else
      outcome = std::unexpected(saved.error());
  }

  std::optional<std::string> trace;
  if (!outcome) {
    trace = outcome.error().describe();
    if (auto saved = store.save_error(id, *trace); !saved)
      spdlog::error("Job '{}': {}", id, saved.error().describe());
  }

  std::lock_guard<std::mutex> lock(mutex);
  auto it = jobs.find(id);
  if (it == jobs.end())
    return;

  auto &record       = it->second;
  record.finished_at = clock::now();
  if (outcome) {
    record.status     = job_status::completed;
    record.result_ref = std::move(result_ref);
    spdlog::info("Job '{}' completed", id);
  } else {
    record.status = job_status::failed;
    record.error  = std::move(trace);
    spdlog::warn("Job '{}' failed: {}", id, *record.error);
  }
}

} // namespace bomscan
