#include "server.h"

#include <cctype>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <evalbox/paths.h>
#include <evalbox/utils.h>

#include "audit.h"
#include "http_utils.h"

namespace {

using nlohmann::json;

bool IsBlank(const std::string& str) {
  return std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
}

bool OptionalLong(const json& body, const char* key, std::optional<long>& out, std::string& error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) return true;
  if (!it->is_number_integer()) {
    error = std::string(key) + " must be an integer";
    return false;
  }
  out = it->get<long>();
  return true;
}

bool OptionalMapping(const json& body, const char* key, std::optional<json>& out, std::string& error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) return true;
  if (!it->is_object()) {
    error = std::string(key) + " must be an object";
    return false;
  }
  out = *it;
  return true;
}

void Reject(httplib::Response& res, const std::string& detail) {
  http_utils::SetJson(res, http_utils::kStatusUnprocessable, {{"detail", detail}});
}

// releases an admission slot
class InFlightGuard {
  std::atomic<size_t>& counter_;
 public:
  explicit InFlightGuard(std::atomic<size_t>& counter) : counter_(counter) {}
  ~InFlightGuard() { counter_--; }
  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;
};

} // namespace

bool ParseExecuteParams(const json& body, ExecuteParams& params, std::string& error) {
  if (!body.is_object()) {
    error = "Request body must be a JSON object";
    return false;
  }
  auto code = body.find("code");
  if (code == body.end() || !code->is_string()) {
    error = "code must be a string";
    return false;
  }
  params.request.code = code->get<std::string>();
  if (IsBlank(params.request.code)) {
    error = "Code cannot be empty or whitespace only";
    return false;
  }
  if (params.request.code.size() > kMaxCodeLength) {
    error = "Code exceeds " + std::to_string(kMaxCodeLength) + " characters";
    return false;
  }
  if (!OptionalLong(body, "timeout", params.timeout_seconds, error) ||
      !OptionalLong(body, "max_memory_mb", params.memory_mb, error) ||
      !OptionalMapping(body, "globals", params.request.initial_globals, error) ||
      !OptionalMapping(body, "locals", params.request.initial_locals, error)) {
    return false;
  }
  if (auto it = body.find("capture_locals"); it != body.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      error = "capture_locals must be a boolean";
      return false;
    }
    params.request.capture_final_locals = it->get<bool>();
  }
  return true;
}

EvalServer::EvalServer(const ServerLimits& limits, size_t parallel, size_t max_queue) :
    limits_(limits), pool_(parallel),
    max_in_flight_(std::max<size_t>(parallel, 1) + max_queue), in_flight_(0) {
  limits_.Validate();
  size_t http_threads = max_in_flight_ + kControlThreads;
  svr_.new_task_queue = [http_threads]() { return new httplib::ThreadPool(http_threads); };
  spdlog::debug("Admitting at most {} executions, {} HTTP threads", max_in_flight_, http_threads);
  svr_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) { HandleExecute_(req, res); });
  svr_.Get("/limits", [this](const httplib::Request& req, httplib::Response& res) { HandleLimits_(req, res); });
  svr_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) { HandleHealth_(req, res); });
  svr_.set_logger(http_utils::LogRequest);
}

void EvalServer::HandleExecute_(const httplib::Request& req, httplib::Response& res) {
  std::string user_id = http_utils::HeaderOr(req, "X-User-ID", "anonymous");
  std::string correlation_id = http_utils::HeaderOr(req, "X-Correlation-ID", http_utils::NewCorrelationId());
  res.set_header("X-Correlation-ID", correlation_id);

  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded()) return Reject(res, "Request body is not valid JSON");
  ExecuteParams params;
  std::string error;
  if (!ParseExecuteParams(body, params, error)) {
    spdlog::info("Rejected execution request from user {}: {}", user_id, error);
    return Reject(res, error);
  }
  ExecutorConfig config = limits_.Resolve(params.timeout_seconds, params.memory_mb);
  size_t code_length = params.request.code.size();
  spdlog::info("Code execution request from user {} correlation_id={} code_length={} timeout={} max_memory_mb={}",
               user_id, correlation_id, code_length, config.timeout_seconds(), config.memory_limit_mb());

  if (in_flight_.fetch_add(1) >= max_in_flight_) {
    in_flight_--;
    spdlog::warn("Rejected execution request from user {}: {} executions in flight", user_id, max_in_flight_);
    http_utils::SetJson(res, kStatusServiceUnavailable, {{"detail", "Too many executions in progress"}});
    return;
  }
  InFlightGuard guard(in_flight_);
  auto future = pool_.Submit(config, std::move(params.request));
  spdlog::debug("Execution queued, {} pending", pool_.QueueSize());
  ExecutionResult result = future.get();
  int status = http_utils::StatusForResult(result);
  if (result.error) {
    auto log_level = status == 500 || status == 400 ? spdlog::level::info : spdlog::level::warn;
    spdlog::log(log_level, "Code execution for user {} failed: {} ({})",
                user_id, ErrorKindToDesc(result.error->kind), result.error->message);
  }
  EmitAudit({
    user_id, correlation_id, code_length, result.execution_time_seconds, result.success,
    result.error ? std::optional<ErrorKind>(result.error->kind) : std::nullopt,
    config.timeout_seconds(), config.memory_limit_mb(),
  });
  http_utils::SetJson(res, status, http_utils::ResultToJson(result));
}

void EvalServer::HandleLimits_(const httplib::Request&, httplib::Response& res) {
  http_utils::SetJson(res, 200, limits_.ToJson(MemoryLimitSupported()));
}

void EvalServer::HandleHealth_(const httplib::Request&, httplib::Response& res) {
  bool available = false;
  try {
    ExecutorConfig config(limits_.default_timeout_seconds, limits_.default_memory_mb);
    available = WorkerAvailable();
    if (!available) spdlog::error("Worker executable {} is not available", WorkerPath().c_str());
  } catch (const ConfigurationError& err) {
    spdlog::error("Executor health check failed: {}", err.what());
  }
  http_utils::SetJson(res, 200, {
    {"status", available ? "healthy" : "degraded"},
    {"executor_available", available},
    {"default_timeout", limits_.default_timeout_seconds},
    {"default_memory_limit_mb", limits_.default_memory_mb},
    {"memory_limit_enforced", MemoryLimitSupported()},
  });
}

bool EvalServer::Listen(const std::string& host, int port) {
  spdlog::info("Listening on {}:{}", host, port);
  return svr_.listen(host, port);
}

int EvalServer::BindToAnyPort(const std::string& host) {
  return svr_.bind_to_any_port(host);
}

bool EvalServer::ListenAfterBind() {
  return svr_.listen_after_bind();
}

bool EvalServer::IsRunning() const {
  return svr_.is_running();
}

void EvalServer::Stop() {
  svr_.stop();
}
