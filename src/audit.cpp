#include "audit.h"

#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <evalbox/utils.h>

namespace {

constexpr char kAuditLoggerName[] = "audit";
constexpr char kAuditPattern[] = "[%Y-%m-%d %H:%M:%S.%e] [audit] %v";
std::mutex audit_mtx;
std::shared_ptr<spdlog::logger> audit_logger;

void SetAuditLogger(std::shared_ptr<spdlog::logger> logger) {
  logger->set_pattern(kAuditPattern);
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::info);
  std::lock_guard lck(audit_mtx);
  audit_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> AuditLogger() {
  std::lock_guard lck(audit_mtx);
  if (!audit_logger) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    audit_logger = std::make_shared<spdlog::logger>(kAuditLoggerName, sink);
    audit_logger->set_pattern(kAuditPattern);
  }
  return audit_logger;
}

} // namespace

nlohmann::json AuditRecord::ToJson() const {
  return {
    {"event", "code_execution"},
    {"user_id", user_id},
    {"correlation_id", correlation_id},
    {"code_length", code_length},
    {"duration_seconds", duration_seconds},
    {"success", success},
    {"error_kind", error_kind ? nlohmann::json(ErrorKindName(*error_kind)) : nlohmann::json(nullptr)},
    {"timeout_seconds", timeout_seconds},
    {"memory_limit_mb", memory_limit_mb},
  };
}

void InitAuditLog(const std::string& path) {
  if (path.empty()) {
    InitAuditLog(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  } else {
    spdlog::info("Writing audit records to {}", path);
    InitAuditLog(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));
  }
}

void InitAuditLog(spdlog::sink_ptr sink) {
  SetAuditLogger(std::make_shared<spdlog::logger>(kAuditLoggerName, std::move(sink)));
}

void EmitAudit(const AuditRecord& record) {
  AuditLogger()->info(record.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}
