#include "service.hpp"
#include "spdlog/spdlog.h"
#include <format>
#include <istream>
#include <ostream>
#include <string>

namespace bomscan {

nlohmann::json error_response(const nlohmann::json &id, const failure &error)
{
  return {
    { "id", id },
    { "error", { { "kind", std::string(errc_name(error.code)) }, { "message", error.message } } },
  };
}

nlohmann::json service::handle(const nlohmann::json &request)
{
  if (!request.is_object())
    return error_response(nullptr, failure{ errc::malformed_input, "Request must be a JSON object" });

  const auto id = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
  if (!request.contains("op") || !request["op"].is_string())
    return error_response(id, failure{ errc::malformed_input, "Missing 'op'" });
  if (!id.is_string())
    return error_response(id, failure{ errc::malformed_input, "Missing 'id'" });

  const auto op     = request["op"].get<std::string>();
  const auto job_id = id.get<std::string>();

  if (op == "submit") {
    if (!request.contains("source") || !request["source"].is_string())
      return error_response(id, failure{ errc::malformed_input, "Missing 'source'" });
    auto view = registry.submit(job_id, request["source"].get<std::string>());
    return view ? to_json(*view) : error_response(id, view.error());
  }

  if (op == "poll") {
    auto view = registry.poll(job_id);
    return view ? to_json(*view) : error_response(id, view.error());
  }

  if (op == "delete") {
    auto removed = registry.remove(job_id);
    if (!removed)
      return error_response(id, removed.error());
    return { { "id", id }, { "deleted", true } };
  }

  if (op == "cancel") {
    auto view = registry.cancel(job_id);
    return view ? to_json(*view) : error_response(id, view.error());
  }

  return error_response(id, failure{ errc::unsupported, std::format("Unknown op '{}'", op) });
}

nlohmann::json service::handle_line(std::string_view line)
{
  const auto request = nlohmann::json::parse(line, nullptr, false);
  if (request.is_discarded())
    return error_response(nullptr, failure{ errc::malformed_input, "Request is not valid JSON" });
  return handle(request);
}

void service::serve(std::istream &in, std::ostream &out)
{
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos)
      continue;
    spdlog::debug("Request: {}", line);
    out << handle_line(line).dump() << std::endl;
  }
}

} // namespace bomscan
