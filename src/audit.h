#ifndef AUDIT_H_
#define AUDIT_H_

#include <string>
#include <optional>

#include <spdlog/common.h>
#include <nlohmann/json_fwd.hpp>
#include <evalbox/execution.h>

struct AuditRecord {
  std::string user_id;
  std::string correlation_id;
  size_t code_length;
  double duration_seconds;
  bool success;
  std::optional<ErrorKind> error_kind;
  long timeout_seconds, memory_limit_mb;

  nlohmann::json ToJson() const;
};

// Audit records go to the "audit" logger; path empty = stdout
void InitAuditLog(const std::string& path);
void InitAuditLog(spdlog::sink_ptr sink);
// lazily falls back to stdout if InitAuditLog was never called
void EmitAudit(const AuditRecord&);

#endif  // AUDIT_H_
