#pragma once

#include "job_registry.hpp"
#include "nlohmann/json.hpp"
#include <iosfwd>
#include <string_view>

namespace bomscan {

/**
 * @brief JSON-lines front end of the job registry.
 *
 * One request object per line:
 *   {"op": "submit", "id": "x", "source": "https://host/repo.git@branch"}
 *   {"op": "poll" | "delete" | "cancel", "id": "x"}
 * One response object per line: a job view, {"id", "deleted": true} or
 * {"id", "error": {"kind", "message"}}.
 */
class service {
public:
  explicit service(job_registry &registry) : registry(registry)
  {
  }

  nlohmann::json handle(const nlohmann::json &request);
  nlohmann::json handle_line(std::string_view line);

  // Processes requests until end of input
  void serve(std::istream &in, std::ostream &out);

private:
  job_registry &registry;
};

nlohmann::json error_response(const nlohmann::json &id, const failure &error);

} // namespace bomscan
