#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Mapping between engine results and HTTP

#include <string>
#include <httplib.h>
#include <nlohmann/json_fwd.hpp>
#include <evalbox/execution.h>

namespace http_utils {

constexpr int kStatusUnprocessable = 422;

bool IsSuccess(int code);
// 200 success; 400 SYNTAX; 408 TIMEOUT; 507 MEMORY_LIMIT; 500 otherwise
int StatusForResult(const ExecutionResult&);
nlohmann::json ResultToJson(const ExecutionResult&);

void SetJson(httplib::Response&, int status, const nlohmann::json&);
std::string HeaderOr(const httplib::Request&, const char* key, const std::string& def);
// 32 hex digits
std::string NewCorrelationId();
// for httplib::Server::set_logger
void LogRequest(const httplib::Request&, const httplib::Response&);

} // namespace http_utils

#endif  // HTTP_UTILS_H_
