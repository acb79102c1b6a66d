#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "toolchain.hpp"
#include "utilities.hpp"
#include <filesystem>

namespace bomscan::test {

namespace fs = std::filesystem;
using ::testing::HasSubstr;

// Drives process_toolchain with shell one-liners in place of the real tools
class ProcessToolchainTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    test_path = fs::temp_directory_path() / "bomscan_toolchain_test";
    fs::remove_all(test_path);
    fs::create_directories(test_path / "job");

    scope.job_id        = "job";
    scope.job_directory = test_path / "job";
  }

  void TearDown() override
  {
    fs::remove_all(test_path);
  }

  fs::path test_path;
  configuration config;
  job_scope scope;
};

TEST_F(ProcessToolchainTest, FetchRendersTemplateAndReturnsCheckout)
{
  config.commands["fetch"] = { R"(mkdir -p "{{ checkout }}" && echo "{% if has_branch %}{{ branch }}{% else %}default{% endif %}" > "{{ checkout }}/BRANCH")" };
  process_toolchain tools(config);

  auto checkout = tools.fetch("https://example.com/org/service.git@develop", scope);
  ASSERT_TRUE(checkout.has_value()) << checkout.error().describe();
  EXPECT_EQ(*checkout, test_path / "job" / "service");
  EXPECT_EQ(read_text_file(*checkout / "BRANCH").value(), "develop\n");

  // A second fetch replaces the previous checkout
  write_text_file(*checkout / "stale.txt", "x").value();
  checkout = tools.fetch("https://example.com/org/service.git", scope);
  ASSERT_TRUE(checkout.has_value());
  EXPECT_FALSE(fs::exists(*checkout / "stale.txt"));
  EXPECT_EQ(read_text_file(*checkout / "BRANCH").value(), "default\n");
}

TEST_F(ProcessToolchainTest, FetchFailureCarriesToolOutput)
{
  config.commands["fetch"] = { "echo 'fatal: repository not found'; exit 128" };
  process_toolchain tools(config);

  auto checkout = tools.fetch("https://example.com/org/missing.git", scope);
  ASSERT_FALSE(checkout.has_value());
  EXPECT_TRUE(checkout.error().is(errc::fetch_error));
  EXPECT_THAT(checkout.error().message, HasSubstr("fatal: repository not found"));
  EXPECT_THAT(checkout.error().message, HasSubstr("128"));
}

TEST_F(ProcessToolchainTest, FetchRejectsShellInBranch)
{
  process_toolchain tools(config);

  auto checkout = tools.fetch("https://example.invalid/org/app.git@main$(touch${IFS}PWNED)", scope);
  ASSERT_FALSE(checkout.has_value());
  EXPECT_TRUE(checkout.error().is(errc::fetch_error));
  EXPECT_FALSE(fs::exists(test_path / "job" / "PWNED"));
  EXPECT_FALSE(fs::exists(fs::current_path() / "PWNED"));
  EXPECT_FALSE(fs::exists(test_path / "job" / "fetch-0.log"));
}

TEST_F(ProcessToolchainTest, FetchRejectsUnsafeReferencesBeforeRunning)
{
  config.commands["fetch"] = { R"(touch "{{ job_dir }}/ran" && mkdir -p "{{ checkout }}")" };
  process_toolchain tools(config);

  for (const auto *source: { "https://example.invalid/org/app.git;touch${IFS}x",
                             "https://example.invalid/org/`id`.git",
                             "-uploadpack=touch /tmp/x",
                             "https://example.invalid/org/app.git@-f",
                             "https://example.invalid/org/app.git@a..b",
                             "https://example.invalid/org/app.git@topic.lock",
                             "https://example.invalid/org/app.git@x|y" }) {
    auto checkout = tools.fetch(source, scope);
    ASSERT_FALSE(checkout.has_value()) << source;
    EXPECT_TRUE(checkout.error().is(errc::fetch_error)) << source;
  }
  EXPECT_FALSE(fs::exists(test_path / "job" / "ran"));

  ASSERT_TRUE(tools.fetch("https://example.invalid/org/app.git@feature-1.2_x", scope).has_value());
  EXPECT_TRUE(fs::exists(test_path / "job" / "ran"));
}

TEST_F(ProcessToolchainTest, CommandsRunInRepository)
{
  fs::create_directories(test_path / "job" / "repo");
  scope.repository = test_path / "job" / "repo";

  config.commands["tidy_modules"] = { "pwd > tidy.txt" };
  process_toolchain tools(config);

  ASSERT_TRUE(tools.tidy_modules(scope).has_value());
  auto output = read_text_file(scope.repository / "tidy.txt").value();
  output.pop_back();
  EXPECT_TRUE(fs::equivalent(output, scope.repository));
}

TEST_F(ProcessToolchainTest, SequenceStopsAtFirstFailure)
{
  fs::create_directories(test_path / "job" / "repo");
  scope.repository = test_path / "job" / "repo";

  config.commands["tidy_modules"] = { "echo first > first.txt", "echo 'go: updates to go.mod needed'; exit 1", "echo third > third.txt" };
  process_toolchain tools(config);

  auto result = tools.tidy_modules(scope);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is(errc::dependency_install_error));
  EXPECT_THAT(result.error().message, HasSubstr("go: updates to go.mod needed"));
  EXPECT_TRUE(fs::exists(scope.repository / "first.txt"));
  EXPECT_FALSE(fs::exists(scope.repository / "third.txt"));
}

TEST_F(ProcessToolchainTest, ScanProducesThreeReports)
{
  config.commands["scan"] = { R"(cp "{{ sbom }}" "{{ structured }}" && echo '{}' > "{{ flat }}" && echo table > "{{ table }}")" };
  process_toolchain tools(config);

  write_text_file(scope.job_directory / "sbom.json", R"({"components": []})").value();
  const scan_reports destination{ scope.job_directory / "s.json", scope.job_directory / "f.json", scope.job_directory / "t.txt" };
  auto reports = tools.scan(scope.job_directory / "sbom.json", destination, scope);
  ASSERT_TRUE(reports.has_value()) << reports.error().describe();
  EXPECT_TRUE(fs::exists(reports->structured));
  EXPECT_TRUE(fs::exists(reports->flat));
  EXPECT_TRUE(fs::exists(reports->table));
}

TEST_F(ProcessToolchainTest, ScanMissingReportIsScanError)
{
  config.commands["scan"] = { R"(echo '{}' > "{{ flat }}")" };
  process_toolchain tools(config);

  const scan_reports destination{ scope.job_directory / "s.json", scope.job_directory / "f.json", scope.job_directory / "t.txt" };
  auto reports = tools.scan(scope.job_directory / "sbom.json", destination, scope);
  ASSERT_FALSE(reports.has_value());
  EXPECT_TRUE(reports.error().is(errc::scan_error));
}

TEST_F(ProcessToolchainTest, StageTimeout)
{
  config.stage_timeout                     = std::chrono::seconds(1);
  config.commands["install_tree_renderer"] = { "sleep 10" };
  process_toolchain tools(config);

  auto result = tools.install_tree_renderer(scope);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is(errc::timeout));
}

TEST_F(ProcessToolchainTest, StageTimeoutCoversEveryCommand)
{
  config.stage_timeout                     = std::chrono::seconds(1);
  config.commands["install_tree_renderer"] = { "sleep 0.7", "sleep 0.7", R"(touch "{{ job_dir }}/third")" };
  process_toolchain tools(config);

  auto result = tools.install_tree_renderer(scope);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is(errc::timeout));
  EXPECT_FALSE(fs::exists(test_path / "job" / "third"));
}

TEST_F(ProcessToolchainTest, TemplateErrorIsConfigurationError)
{
  config.commands["install_tree_renderer"] = { "echo {{ unknown_variable }}" };
  process_toolchain tools(config);

  auto result = tools.install_tree_renderer(scope);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is(errc::invalid_configuration));
}

TEST_F(ProcessToolchainTest, ConfiguredMavenHome)
{
  const auto maven_home = test_path / "maven";
  fs::create_directories(maven_home / "bin");
  write_text_file(maven_home / "bin" / "mvn", "#!/bin/sh\n").value();
  config.maven.home = maven_home;
  process_toolchain tools(config);

  auto tool = tools.acquire_build_tool(scope);
  ASSERT_TRUE(tool.has_value()) << tool.error().describe();
  EXPECT_EQ(*tool, maven_home / "bin" / "mvn");
}

TEST_F(ProcessToolchainTest, DeclaredManifest)
{
  fs::create_directories(test_path / "repo");
  EXPECT_FALSE(find_declared_manifest(test_path / "repo").has_value());

  write_text_file(test_path / "repo" / "pyproject.toml", "[project]\n").value();
  EXPECT_EQ(find_declared_manifest(test_path / "repo"), test_path / "repo" / "pyproject.toml");

  write_text_file(test_path / "repo" / "requirements.txt", "").value();
  EXPECT_EQ(find_declared_manifest(test_path / "repo"), test_path / "repo" / "requirements.txt");
}

} // namespace bomscan::test
