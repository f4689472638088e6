#include "http_utils.h"

#include <random>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <evalbox/utils.h>

namespace http_utils {

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

int StatusForResult(const ExecutionResult& res) {
  if (res.success || !res.error) return 200;
  switch (res.error->kind) {
    case ErrorKind::SYNTAX: return 400;
    case ErrorKind::TIMEOUT: return 408;
    case ErrorKind::MEMORY_LIMIT: return 507;
    case ErrorKind::NAME: [[fallthrough]];
    case ErrorKind::VALUE: [[fallthrough]];
    case ErrorKind::ZERO_DIVISION: [[fallthrough]];
    case ErrorKind::EXECUTION_FAILED: return 500;
  }
  __builtin_unreachable();
}

nlohmann::json ResultToJson(const ExecutionResult& res) {
  using nlohmann::json;
  json error = nullptr;
  if (res.error) error = {{"kind", ErrorKindName(res.error->kind)}, {"message", res.error->message}};
  return {
    {"success", res.success},
    {"stdout", res.captured_stdout},
    {"stderr", res.captured_stderr},
    {"error", error},
    {"execution_time_seconds", res.execution_time_seconds},
    {"memory_used_mb", res.memory_used_mb},
    {"memory_limit_applied", res.memory_limit_applied},
    {"final_locals", res.final_locals ? *res.final_locals : json(nullptr)},
  };
}

void SetJson(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

std::string HeaderOr(const httplib::Request& req, const char* key, const std::string& def) {
  if (!req.has_header(key)) return def;
  std::string val = req.get_header_value(key);
  return val.empty() ? def : val;
}

std::string NewCorrelationId() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  return fmt::format("{:016x}{:016x}", gen(), gen());
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  spdlog::log(IsSuccess(res.status) ? spdlog::level::info : spdlog::level::warn,
              "{} {} {} -> {} ({} bytes)", req.remote_addr, req.method, req.path, res.status, res.body.size());
}

} // namespace http_utils
