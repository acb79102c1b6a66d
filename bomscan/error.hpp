#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace bomscan {

enum class errc {
  conflict = 1,
  not_found,
  invalid_state,
  invalid_job_id,
  fetch_error,
  dependency_install_error,
  sbom_generation_error,
  scan_error,
  tool_acquisition_error,
  malformed_input,
  empty_input,
  unsupported,
  timeout,
  cancelled,
  io_error,
  invalid_configuration,
};

const std::error_category &bomscan_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// Short machine readable name, e.g. "scan_error"
std::string_view errc_name(const std::error_code &code) noexcept;

/**
 * @brief An error code together with the verbatim detail that caused it.
 *        For tool failures the message holds the complete tool output.
 */
struct failure {
  std::error_code code;
  std::string message;

  failure() = default;
  failure(errc e, std::string message_text) : code(make_error_code(e)), message(std::move(message_text))
  {
  }
  failure(std::error_code ec, std::string message_text) : code(ec), message(std::move(message_text))
  {
  }

  [[nodiscard]] bool is(errc e) const noexcept
  {
    return code == make_error_code(e);
  }

  // "<kind>: <message>"
  [[nodiscard]] std::string describe() const;
};

} // namespace bomscan

namespace std {
template<> struct is_error_code_enum<bomscan::errc> : true_type {};
} // namespace std
