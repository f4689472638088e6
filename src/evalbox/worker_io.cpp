#include "worker_io.h"

#include <errno.h>
#include <unistd.h>
#include <cstring>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace {

using Int = long;

bool WriteAll(int fd, const char* buf, size_t len) {
  while (len) {
    ssize_t ret = write(fd, buf, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    buf += ret;
    len -= ret;
  }
  return true;
}

bool ReadAll(int fd, char* buf, size_t len) {
  while (len) {
    ssize_t ret = read(fd, buf, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (ret == 0) return false;
    buf += ret;
    len -= ret;
  }
  return true;
}

template <class T>
std::optional<T> OptionalField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return std::nullopt;
  return it->get<T>();
}

} // namespace

std::string SerializeRequest(const WorkerRequest& req) {
  nlohmann::json ret = {
    {"code", req.request.code},
    {"capture_final_locals", req.request.capture_final_locals},
    {"memory_limit_mb", req.memory_limit_mb},
    {"initial_globals", nullptr},
    {"initial_locals", nullptr},
  };
  if (req.request.initial_globals) ret["initial_globals"] = *req.request.initial_globals;
  if (req.request.initial_locals) ret["initial_locals"] = *req.request.initial_locals;
  return ret.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<WorkerRequest> ParseRequest(const std::string& str) {
  try {
    nlohmann::json obj = nlohmann::json::parse(str);
    WorkerRequest ret;
    ret.request.code = obj.at("code").get<std::string>();
    ret.request.capture_final_locals = obj.at("capture_final_locals").get<bool>();
    ret.request.initial_globals = OptionalField<nlohmann::json>(obj, "initial_globals");
    ret.request.initial_locals = OptionalField<nlohmann::json>(obj, "initial_locals");
    ret.memory_limit_mb = obj.at("memory_limit_mb").get<long>();
    return ret;
  } catch (const nlohmann::json::exception& e) {
    spdlog::error("Malformed worker request: {}", e.what());
    return std::nullopt;
  }
}

std::string SerializeOutcome(const RawWorkerOutcome& res) {
  nlohmann::json ret = {
    {"success", res.success},
    {"stdout", res.stdout_text},
    {"stderr", res.stderr_text},
    {"memory_used_mb", res.memory_used_mb},
    {"memory_limit_applied", res.memory_limit_applied},
    {"final_locals", nullptr},
    {"error_kind", nullptr},
    {"error_message", nullptr},
  };
  if (res.final_locals) ret["final_locals"] = *res.final_locals;
  if (res.error_kind) ret["error_kind"] = *res.error_kind;
  if (res.error_message) ret["error_message"] = *res.error_message;
  // captured output may contain invalid UTF-8
  return ret.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<RawWorkerOutcome> ParseOutcome(const std::string& str) {
  try {
    nlohmann::json obj = nlohmann::json::parse(str);
    RawWorkerOutcome ret;
    ret.success = obj.at("success").get<bool>();
    ret.stdout_text = obj.value("stdout", "");
    ret.stderr_text = obj.value("stderr", "");
    ret.memory_used_mb = obj.value("memory_used_mb", 0.0);
    ret.memory_limit_applied = obj.value("memory_limit_applied", false);
    ret.final_locals = OptionalField<nlohmann::json>(obj, "final_locals");
    ret.error_kind = OptionalField<std::string>(obj, "error_kind");
    ret.error_message = OptionalField<std::string>(obj, "error_message");
    return ret;
  } catch (const nlohmann::json::exception& e) {
    spdlog::warn("Malformed worker outcome: {}", e.what());
    return std::nullopt;
  }
}

bool WriteFrame(int fd, const std::string& payload) {
  Int size = payload.size();
  return WriteAll(fd, (const char*)&size, sizeof(size)) &&
         WriteAll(fd, payload.data(), payload.size());
}

std::optional<std::string> ReadFrame(int fd) {
  Int size = 0;
  if (!ReadAll(fd, (char*)&size, sizeof(size)) || size < 0) return std::nullopt;
  std::string ret(size, '\0');
  if (!ReadAll(fd, ret.data(), size)) return std::nullopt;
  return ret;
}

std::optional<std::string> DecodeFrame(const std::string& buf) {
  Int size = 0;
  if (buf.size() < sizeof(size)) return std::nullopt;
  memcpy(&size, buf.data(), sizeof(size));
  if (size < 0 || buf.size() - sizeof(size) != (size_t)size) return std::nullopt;
  return buf.substr(sizeof(size));
}
