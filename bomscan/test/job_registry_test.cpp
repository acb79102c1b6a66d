#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "job_registry.hpp"
#include "fake_toolchain.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

namespace bomscan::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class JobRegistryTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    test_path = fs::temp_directory_path() / "bomscan_registry_test";
    fs::remove_all(test_path);
    fs::create_directories(test_path);
  }

  void TearDown() override
  {
    release = true;
    registry.reset();
    fs::remove_all(test_path);
  }

  job_registry &make_registry(std::size_t workers = 2)
  {
    registry = std::make_unique<job_registry>(report_store{ test_path }, workers, [this](const scan_job &job) {
      return run_scan_pipeline(job, tools, router);
    });
    return *registry;
  }

  // Holds fetch of the given job (or of every job) until release is set or the job is cancelled
  void block_fetch(std::string only_id = "")
  {
    tools.fetch_hook = [this, only_id](const job_scope &scope) -> std::expected<void, failure> {
      if (!only_id.empty() && scope.job_id != only_id)
        return {};
      while (!release) {
        if (scope.stop.stop_requested())
          return std::unexpected(failure{ errc::cancelled, "fetch interrupted" });
        std::this_thread::sleep_for(5ms);
      }
      return {};
    };
  }

  bool wait_for_status(const std::string &id, job_status status)
  {
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline) {
      auto view = registry->poll(id);
      if (view && view->status == status)
        return true;
      std::this_thread::sleep_for(5ms);
    }
    return false;
  }

  fs::path test_path;
  std::atomic<bool> release{ false };
  fake_toolchain tools;
  stage_router router;
  std::unique_ptr<job_registry> registry;
};

TEST_F(JobRegistryTest, SubmitThenPollUntilCompleted)
{
  auto &jobs = make_registry();

  auto submitted = jobs.submit("x", "https://example.com/org/app.git");
  ASSERT_TRUE(submitted.has_value()) << submitted.error().describe();
  EXPECT_EQ(submitted->status, job_status::pending);
  EXPECT_FALSE(submitted->report.has_value());

  auto early = jobs.poll("x");
  ASSERT_TRUE(early.has_value());
  EXPECT_TRUE(early->status == job_status::pending || early->status == job_status::running || early->status == job_status::completed);
  if (early->status != job_status::completed)
    EXPECT_FALSE(early->report.has_value());

  jobs.wait_for_all();

  auto view = jobs.poll("x");
  ASSERT_TRUE(view.has_value());
  ASSERT_EQ(view->status, job_status::completed) << view->error.value_or("");
  ASSERT_TRUE(view->report.has_value());
  EXPECT_FALSE((*view->report)["results"]["trivy_report_json"].is_null());
  EXPECT_FALSE(view->error.has_value());
  EXPECT_EQ(view->language, "Python");
  EXPECT_EQ(view->dependency_manager, "pip");

  ASSERT_TRUE(view->started_at.has_value());
  ASSERT_TRUE(view->finished_at.has_value());
  EXPECT_LE(*view->started_at, *view->finished_at);

  ASSERT_TRUE(view->result_ref.has_value());
  EXPECT_EQ(*view->result_ref, test_path / "x" / "report.json");
  EXPECT_TRUE(fs::exists(*view->result_ref));
  EXPECT_TRUE(fs::exists(test_path / "x" / "job.log"));
}

TEST_F(JobRegistryTest, ConflictWhileActiveThenResubmit)
{
  auto &jobs = make_registry();
  block_fetch();

  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  auto second = jobs.submit("x", "https://example.com/org/other.git");
  ASSERT_FALSE(second.has_value());
  EXPECT_TRUE(second.error().is(errc::conflict));

  release = true;
  jobs.wait_for_all();
  ASSERT_EQ(jobs.poll("x")->status, job_status::completed);

  auto again = jobs.submit("x", "https://example.com/org/app.git");
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->status, job_status::pending);
  EXPECT_FALSE(again->finished_at.has_value());
  jobs.wait_for_all();
  EXPECT_EQ(jobs.poll("x")->status, job_status::completed);
}

TEST_F(JobRegistryTest, RemoveActiveJobIsInvalidState)
{
  auto &jobs = make_registry();
  block_fetch();

  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  auto removed = jobs.remove("x");
  ASSERT_FALSE(removed.has_value());
  EXPECT_TRUE(removed.error().is(errc::invalid_state));

  release = true;
  jobs.wait_for_all();

  ASSERT_TRUE(jobs.remove("x").has_value());
  EXPECT_FALSE(fs::exists(test_path / "x"));

  auto view = jobs.poll("x");
  ASSERT_FALSE(view.has_value());
  EXPECT_TRUE(view.error().is(errc::not_found));
}

TEST_F(JobRegistryTest, PollUnknownIsNotFound)
{
  auto &jobs = make_registry();
  auto view  = jobs.poll("never-submitted");
  ASSERT_FALSE(view.has_value());
  EXPECT_TRUE(view.error().is(errc::not_found));
}

TEST_F(JobRegistryTest, RemoveUnknownSucceeds)
{
  auto &jobs = make_registry();
  EXPECT_TRUE(jobs.remove("never-submitted").has_value());
}

TEST_F(JobRegistryTest, InvalidJobId)
{
  auto &jobs = make_registry();
  for (const auto *id: { "", "..", "../x", "a b" }) {
    auto submitted = jobs.submit(id, "https://example.com/org/app.git");
    ASSERT_FALSE(submitted.has_value()) << id;
    EXPECT_TRUE(submitted.error().is(errc::invalid_job_id)) << id;
  }
}

TEST_F(JobRegistryTest, FailedJobKeepsVerbatimTrace)
{
  auto &jobs              = make_registry();
  tools.failing_operation = "scan";
  tools.operation_failure = failure{ errc::scan_error, "FATAL: failed to download vulnerability DB" };

  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  jobs.wait_for_all();

  auto view = jobs.poll("x");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, job_status::failed);
  ASSERT_TRUE(view->error.has_value());
  EXPECT_THAT(*view->error, StartsWith("scan_error"));
  EXPECT_THAT(*view->error, HasSubstr("FATAL: failed to download vulnerability DB"));
  EXPECT_FALSE(view->report.has_value());
  EXPECT_FALSE(view->result_ref.has_value());
  EXPECT_TRUE(fs::exists(test_path / "x" / "error.txt"));
}

TEST_F(JobRegistryTest, DurableRecordsSurviveRestart)
{
  {
    auto &jobs = make_registry();
    ASSERT_TRUE(jobs.submit("good", "https://example.com/org/app.git").has_value());
    jobs.wait_for_all();
    tools.failing_operation = "generate_sbom";
    tools.operation_failure = failure{ errc::sbom_generation_error, "cyclonedx-py: no such file" };
    ASSERT_TRUE(jobs.submit("bad", "https://example.com/org/app.git").has_value());
    jobs.wait_for_all();
  }

  // New registry, nothing in memory
  auto &jobs = make_registry();

  auto good = jobs.poll("good");
  ASSERT_TRUE(good.has_value());
  EXPECT_EQ(good->status, job_status::completed);
  ASSERT_TRUE(good->report.has_value());
  EXPECT_EQ((*good->report)["artifacts"]["language"], "Python");
  EXPECT_EQ(good->language, "Python");

  auto bad = jobs.poll("bad");
  ASSERT_TRUE(bad.has_value());
  EXPECT_EQ(bad->status, job_status::failed);
  ASSERT_TRUE(bad->error.has_value());
  EXPECT_THAT(*bad->error, HasSubstr("cyclonedx-py: no such file"));

  ASSERT_TRUE(jobs.remove("good").has_value());
  EXPECT_TRUE(jobs.poll("good").error().is(errc::not_found));
}

TEST_F(JobRegistryTest, CompletedReportIsReadFromStore)
{
  auto &jobs = make_registry();
  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  jobs.wait_for_all();

  // Replace the stored report; poll must serve the file, not a cached copy
  ASSERT_TRUE(jobs.get_store().save_report("x", nlohmann::json{ { "repo", "rewritten" } }).has_value());

  auto view = jobs.poll("x");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, job_status::completed);
  ASSERT_TRUE(view->report.has_value());
  EXPECT_EQ((*view->report)["repo"], "rewritten");

  // A completed job whose report vanished still polls as completed
  fs::remove(test_path / "x" / "report.json");
  view = jobs.poll("x");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, job_status::completed);
  EXPECT_FALSE(view->report.has_value());
}

TEST_F(JobRegistryTest, CancelDurableJobIsInvalidState)
{
  {
    auto &jobs = make_registry();
    ASSERT_TRUE(jobs.submit("good", "https://example.com/org/app.git").has_value());
    jobs.wait_for_all();
    tools.failing_operation = "fetch";
    ASSERT_TRUE(jobs.submit("bad", "https://example.com/org/app.git").has_value());
    jobs.wait_for_all();
  }

  auto &jobs = make_registry();
  for (const auto *id: { "good", "bad" }) {
    auto view = jobs.cancel(id);
    ASSERT_FALSE(view.has_value()) << id;
    EXPECT_TRUE(view.error().is(errc::invalid_state)) << id;
  }
}

TEST_F(JobRegistryTest, ResubmissionClearsStaleError)
{
  auto &jobs              = make_registry();
  tools.failing_operation = "scan";
  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  jobs.wait_for_all();
  ASSERT_TRUE(fs::exists(test_path / "x" / "error.txt"));

  tools.failing_operation.clear();
  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  jobs.wait_for_all();

  EXPECT_EQ(jobs.poll("x")->status, job_status::completed);
  EXPECT_FALSE(fs::exists(test_path / "x" / "error.txt"));
  EXPECT_TRUE(fs::exists(test_path / "x" / "report.json"));
}

TEST_F(JobRegistryTest, CancelRunningJob)
{
  auto &jobs = make_registry();
  block_fetch();

  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  ASSERT_TRUE(wait_for_status("x", job_status::running));

  auto cancelled = jobs.cancel("x");
  ASSERT_TRUE(cancelled.has_value()) << cancelled.error().describe();
  jobs.wait_for_all();

  auto view = jobs.poll("x");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, job_status::failed);
  EXPECT_THAT(view->error.value_or(""), StartsWith("cancelled"));

  auto again = jobs.cancel("x");
  ASSERT_FALSE(again.has_value());
  EXPECT_TRUE(again.error().is(errc::invalid_state));
}

TEST_F(JobRegistryTest, CancelPendingJob)
{
  auto &jobs = make_registry(1);
  block_fetch("first");

  ASSERT_TRUE(jobs.submit("first", "https://example.com/org/app.git").has_value());
  ASSERT_TRUE(wait_for_status("first", job_status::running));
  ASSERT_TRUE(jobs.submit("second", "https://example.com/org/app.git").has_value());
  EXPECT_EQ(jobs.poll("second")->status, job_status::pending);

  ASSERT_TRUE(jobs.cancel("second").has_value());
  release = true;
  jobs.wait_for_all();

  EXPECT_EQ(jobs.poll("first")->status, job_status::completed);
  auto second = jobs.poll("second");
  EXPECT_EQ(second->status, job_status::failed);
  EXPECT_THAT(second->error.value_or(""), StartsWith("cancelled"));

  const auto calls = tools.calls();
  EXPECT_EQ(std::ranges::count(calls, std::string("fetch")), 1);
}

TEST_F(JobRegistryTest, CancelUnknownIsNotFound)
{
  auto &jobs = make_registry();
  auto view  = jobs.cancel("nobody");
  ASSERT_FALSE(view.has_value());
  EXPECT_TRUE(view.error().is(errc::not_found));
}

TEST_F(JobRegistryTest, JobsRunConcurrently)
{
  auto &jobs = make_registry(2);

  std::atomic<int> arrived{ 0 };
  std::atomic<bool> overlapped{ false };
  tools.fetch_hook = [&](const job_scope &) -> std::expected<void, failure> {
    ++arrived;
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (arrived < 2 && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(5ms);
    if (arrived >= 2)
      overlapped = true;
    return {};
  };

  ASSERT_TRUE(jobs.submit("a", "https://example.com/org/app.git").has_value());
  ASSERT_TRUE(jobs.submit("b", "https://example.com/org/app.git").has_value());
  jobs.wait_for_all();

  EXPECT_TRUE(overlapped);
  EXPECT_EQ(jobs.poll("a")->status, job_status::completed);
  EXPECT_EQ(jobs.poll("b")->status, job_status::completed);
  EXPECT_TRUE(fs::exists(test_path / "a" / "report.json"));
  EXPECT_TRUE(fs::exists(test_path / "b" / "report.json"));
}

TEST_F(JobRegistryTest, ViewToJson)
{
  auto &jobs = make_registry();
  ASSERT_TRUE(jobs.submit("x", "https://example.com/org/app.git").has_value());
  jobs.wait_for_all();

  const auto j = to_json(*jobs.poll("x"));
  EXPECT_EQ(j["id"], "x");
  EXPECT_EQ(j["status"], "completed");
  EXPECT_EQ(j["language"], "Python");
  EXPECT_TRUE(j["error"].is_null());
  EXPECT_TRUE(j["report"].is_object());
}

} // namespace bomscan::test
