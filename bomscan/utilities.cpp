#include "utilities.hpp"
#include "subprocess.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <signal.h>
#include <unistd.h>

namespace bomscan {

namespace {
constexpr auto process_poll_interval = std::chrono::milliseconds(50);

fs::path unique_log_path()
{
  static std::atomic<unsigned> counter{ 0 };
  return fs::temp_directory_path() / std::format("bomscan-exec-{}-{}.log", ::getpid(), counter++);
}

// Kills the whole process group of a shell command started as session leader
void terminate_process(subprocess::Popen &p)
{
  ::kill(-p.pid(), SIGKILL);
  p.wait();
}
} // namespace

std::expected<process_return, failure> exec(const std::string &command_text, const std::string &arg_text, const exec_options &options)
{
  std::string command = command_text;
  if (!arg_text.empty())
    command += " " + arg_text;

  const bool owns_log_file = options.log_file.empty();
  const fs::path log_path  = owns_log_file ? unique_log_path() : options.log_file;

  if (options.stop.stop_requested())
    return std::unexpected(failure{ errc::cancelled, std::format("'{}' was cancelled before it started", command) });

  spdlog::info("[{}] {}", options.working_directory.string(), command);

  int retcode = -1;
  try {
    std::error_code ec;
    fs::remove(log_path, ec);

    auto p = subprocess::Popen(command,
                               subprocess::shell{ true },
                               subprocess::cwd{ options.working_directory.string() },
                               subprocess::output{ log_path.c_str() },
                               subprocess::error{ subprocess::STDOUT },
                               subprocess::session_leader{ true });

    const auto start_time = std::chrono::steady_clock::now();
    while ((retcode = p.poll()) == -1) {
      if (options.stop.stop_requested()) {
        terminate_process(p);
        spdlog::warn("Cancelled: {}", command);
        return std::unexpected(failure{ errc::cancelled, std::format("'{}' was cancelled", command) });
      }
      if (options.timeout.count() > 0 && std::chrono::steady_clock::now() - start_time > options.timeout) {
        terminate_process(p);
        auto output = read_text_file(log_path);
        spdlog::error("Timed out after {}ms: {}", options.timeout.count(), command);
        return std::unexpected(failure{ errc::timeout, std::format("'{}' exceeded {}ms\n{}", command, options.timeout.count(), output.value_or("")) });
      }
      std::this_thread::sleep_for(process_poll_interval);
    }
  } catch (std::exception &e) {
    spdlog::error("Exception while executing: {}\n{}", command, e.what());
    return std::unexpected(failure{ errc::io_error, std::format("Exception while executing '{}': {}", command, e.what()) });
  }

  auto output = read_text_file(log_path);
  if (owns_log_file) {
    std::error_code ec;
    fs::remove(log_path, ec);
  }
  if (!output)
    return std::unexpected(output.error());

  spdlog::debug("Returned {}", retcode);
  return process_return{ std::move(*output), retcode };
}

std::pair<std::string, std::string> split_source_reference(std::string_view source_reference)
{
  const auto last_separator = source_reference.find_last_of("/:");
  const auto search_start   = last_separator == std::string_view::npos ? 0 : last_separator + 1;
  const auto at             = source_reference.find('@', search_start);
  if (at == std::string_view::npos)
    return { std::string{ source_reference }, "" };

  return { std::string{ source_reference.substr(0, at) }, std::string{ source_reference.substr(at + 1) } };
}

std::string repository_name_from_url(std::string_view url)
{
  while (!url.empty() && (url.back() == '/' || url.back() == '\\'))
    url.remove_suffix(1);

  const auto last_separator = url.find_last_of("/:");
  std::string name{ last_separator == std::string_view::npos ? url : url.substr(last_separator + 1) };
  if (name.ends_with(".git"))
    name.resize(name.size() - 4);

  return name.empty() ? "repo" : name;
}

std::expected<void, failure> validate_source_reference(std::string_view url, std::string_view branch)
{
  const auto reject = [&](std::string_view reason) {
    return std::unexpected(failure{ errc::fetch_error, std::format("Rejected source '{}{}{}': {}", url, branch.empty() ? "" : "@", branch, reason) });
  };
  const auto has_control_or_space = [](std::string_view text) {
    return std::ranges::any_of(text, [](unsigned char c) {
      return c <= 0x20 || c == 0x7f;
    });
  };
  constexpr std::string_view shell_metacharacters = "\"'`$;|&<>(){}\\!";

  if (url.empty())
    return reject("empty url");
  if (url.front() == '-')
    return reject("url must not start with '-'");
  if (has_control_or_space(url) || url.find_first_of(shell_metacharacters) != std::string_view::npos)
    return reject("url contains whitespace or shell metacharacters");

  if (branch.empty())
    return {};

  // git check-ref-format --branch
  if (has_control_or_space(branch) || branch.find_first_of(shell_metacharacters) != std::string_view::npos)
    return reject("branch contains whitespace or shell metacharacters");
  if (branch.find_first_of("~^:?*[") != std::string_view::npos)
    return reject("branch contains a character git does not allow in ref names");
  if (branch == "@" || branch.front() == '-' || branch.front() == '/' || branch.back() == '/' || branch.back() == '.')
    return reject("invalid branch name");
  if (branch.find("..") != std::string_view::npos || branch.find("//") != std::string_view::npos || branch.find("@{") != std::string_view::npos)
    return reject("invalid branch name");

  std::size_t start = 0;
  while (start <= branch.size()) {
    const auto end       = std::min(branch.find('/', start), branch.size());
    const auto component = branch.substr(start, end - start);
    if (component.starts_with('.') || component.ends_with(".lock"))
      return reject("branch component starts with '.' or ends with '.lock'");
    start = end + 1;
  }
  return {};
}

std::optional<fs::path> find_executable(std::string_view name)
{
  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr)
    return std::nullopt;

  std::stringstream ss(path_env);
  std::string directory;
  while (std::getline(ss, directory, host_os_path_seperator.front())) {
    if (directory.empty())
      continue;
    const auto candidate = fs::path{ directory } / (std::string{ name } + executable_extension);
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && (fs::status(candidate, ec).permissions() & fs::perms::owner_exec) != fs::perms::none)
      return candidate;
  }
  return std::nullopt;
}

std::string format_timestamp(std::chrono::system_clock::time_point time)
{
  return std::format("{:%FT%T}+00:00", std::chrono::floor<std::chrono::microseconds>(time));
}

std::string now_iso()
{
  return format_timestamp(std::chrono::system_clock::now());
}

std::expected<std::string, failure> read_text_file(const fs::path &path)
{
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open())
    return std::unexpected(failure{ errc::io_error, std::format("Cannot open '{}'", path.string()) });

  return std::string{ std::istreambuf_iterator<char>{ file }, {} };
}

std::expected<void, failure> write_text_file(const fs::path &path, std::string_view content)
{
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file.is_open())
    return std::unexpected(failure{ errc::io_error, std::format("Cannot write '{}'", path.string()) });

  file << content;
  if (!file.good())
    return std::unexpected(failure{ errc::io_error, std::format("Failed writing '{}'", path.string()) });
  return {};
}

std::optional<nlohmann::json> try_load_json(const fs::path &path)
{
  std::error_code ec;
  if (!fs::exists(path, ec))
    return std::nullopt;

  try {
    std::ifstream ifs(path);
    return nlohmann::json::parse(ifs);
  } catch (const std::exception &e) {
    spdlog::debug("Could not parse '{}': {}", path.string(), e.what());
    return std::nullopt;
  }
}

} // namespace bomscan
