#include "error.hpp"
#include <format>

namespace bomscan {

namespace {
class bomscan_error_category final : public std::error_category {
public:
  const char *name() const noexcept override
  {
    return "bomscan";
  }

  std::string message(int value) const override
  {
    switch (static_cast<errc>(value)) {
      case errc::conflict:
        return "job is already active";
      case errc::not_found:
        return "job not found";
      case errc::invalid_state:
        return "operation not allowed in the current job state";
      case errc::invalid_job_id:
        return "invalid job id";
      case errc::fetch_error:
        return "failed to fetch source";
      case errc::dependency_install_error:
        return "failed to install dependencies";
      case errc::sbom_generation_error:
        return "failed to generate SBOM";
      case errc::scan_error:
        return "vulnerability scan failed";
      case errc::tool_acquisition_error:
        return "failed to acquire build tool";
      case errc::malformed_input:
        return "malformed input";
      case errc::empty_input:
        return "empty input";
      case errc::unsupported:
        return "unsupported ecosystem";
      case errc::timeout:
        return "stage timed out";
      case errc::cancelled:
        return "job cancelled";
      case errc::io_error:
        return "i/o error";
      case errc::invalid_configuration:
        return "invalid configuration";
    }
    return "unknown error";
  }
};
} // namespace

const std::error_category &bomscan_category() noexcept
{
  static const bomscan_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept
{
  return { static_cast<int>(e), bomscan_category() };
}

std::string_view errc_name(const std::error_code &code) noexcept
{
  if (code.category() != bomscan_category())
    return "system_error";

  switch (static_cast<errc>(code.value())) {
    case errc::conflict:
      return "conflict";
    case errc::not_found:
      return "not_found";
    case errc::invalid_state:
      return "invalid_state";
    case errc::invalid_job_id:
      return "invalid_job_id";
    case errc::fetch_error:
      return "fetch_error";
    case errc::dependency_install_error:
      return "dependency_install_error";
    case errc::sbom_generation_error:
      return "sbom_generation_error";
    case errc::scan_error:
      return "scan_error";
    case errc::tool_acquisition_error:
      return "tool_acquisition_error";
    case errc::malformed_input:
      return "malformed_input";
    case errc::empty_input:
      return "empty_input";
    case errc::unsupported:
      return "unsupported";
    case errc::timeout:
      return "timeout";
    case errc::cancelled:
      return "cancelled";
    case errc::io_error:
      return "io_error";
    case errc::invalid_configuration:
      return "invalid_configuration";
  }
  return "unknown";
}

std::string failure::describe() const
{
  if (message.empty())
    return std::format("{}: {}", errc_name(code), code.message());
  return std::format("{}: {}", errc_name(code), message);
}

} // namespace bomscan
