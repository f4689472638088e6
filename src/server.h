#ifndef SERVER_H_
#define SERVER_H_

#include <atomic>
#include <string>
#include <optional>

#include <httplib.h>
#include <nlohmann/json_fwd.hpp>
#include <evalbox/execution.h>
#include "server_limits.h"

constexpr size_t kMaxCodeLength = 50000;
constexpr int kStatusServiceUnavailable = 503;
// HTTP threads kept free of executions, for /health and /limits
constexpr size_t kControlThreads = 4;

// Parameters of POST /execute before limits are resolved
struct ExecuteParams {
  ExecutionRequest request;
  std::optional<long> timeout_seconds, memory_mb;
};

// false with a message for the caller if the body is not acceptable
bool ParseExecuteParams(const nlohmann::json& body, ExecuteParams& params, std::string& error);

// HTTP front of the engine: POST /execute, GET /limits, GET /health.
// At most parallel + max_queue executions are admitted, each holding one HTTP thread while it waits;
// the HTTP pool has kControlThreads more than that, so the other endpoints stay responsive.
class EvalServer {
  ServerLimits limits_;
  ExecutionPool pool_;
  const size_t max_in_flight_;
  std::atomic<size_t> in_flight_;
  httplib::Server svr_;

  void HandleExecute_(const httplib::Request&, httplib::Response&);
  void HandleLimits_(const httplib::Request&, httplib::Response&);
  void HandleHealth_(const httplib::Request&, httplib::Response&);
 public:
  EvalServer(const ServerLimits& limits, size_t parallel, size_t max_queue);

  // executions admitted and not yet answered
  size_t InFlight() const { return in_flight_.load(); }

  // blocking
  bool Listen(const std::string& host, int port);
  // returns the port, or -1; then call ListenAfterBind()
  int BindToAnyPort(const std::string& host);
  bool ListenAfterBind();
  bool IsRunning() const;
  void Stop();
};

#endif  // SERVER_H_
