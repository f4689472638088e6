#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "worker_runtime.h"

#include <signal.h>
#include <sys/resource.h>
#include <memory>
#include <fstream>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "utils.h"

namespace {

struct PyDecRef {
  void operator()(PyObject* obj) const { Py_XDECREF(obj); }
};
// owned reference
using PyRef = std::unique_ptr<PyObject, PyDecRef>;

constexpr char kSnippetFilename[] = "<snippet>";

// raised into the snippet when the reconciler sends SIGTERM
PyObject* terminated_type = nullptr;

PyObject* OnTerminate(PyObject*, PyObject*) {
  PyErr_SetString(terminated_type, "terminated by timeout");
  return nullptr;
}

PyMethodDef kOnTerminateDef = {"_evalbox_on_terminate", OnTerminate, METH_VARARGS, nullptr};

// Unwinding the snippet on SIGTERM lets us report its partial output within the grace period.
// A snippet that replaces the handler is simply killed afterwards.
bool InstallTerminationHandler() {
  terminated_type = PyErr_NewException("evalbox.Terminated", PyExc_BaseException, nullptr);
  PyRef signal_mod(PyImport_ImportModule("signal"));
  PyRef handler(PyCFunction_New(&kOnTerminateDef, nullptr));
  if (!terminated_type || !signal_mod || !handler) return false;
  PyRef ret(PyObject_CallMethod(signal_mod.get(), "signal", "iO", SIGTERM, handler.get()));
  return ret != nullptr;
}

// Peak RSS of this process image. Unlike getrusage(), VmHWM is reset by execve,
// so it does not include the pages the launcher had when it forked us.
double PeakRssMb() {
  std::ifstream fin("/proc/self/status");
  std::string line;
  while (std::getline(fin, line)) {
    if (line.rfind("VmHWM:", 0) == 0) {
      try {
        return std::stol(line.substr(6)) / 1024.0; // kB
      } catch (const std::logic_error&) {
        spdlog::warn("Unexpected VmHWM line: {}", line);
        return 0;
      }
    }
  }
  spdlog::warn("VmHWM not available; reporting no memory usage");
  return 0;
}

std::string UnicodeToString(PyObject* str) {
  PyRef bytes(PyUnicode_AsEncodedString(str, "utf-8", "backslashreplace"));
  if (!bytes) {
    PyErr_Clear();
    return "";
  }
  return std::string(PyBytes_AS_STRING(bytes.get()), PyBytes_GET_SIZE(bytes.get()));
}

std::string StrOf(PyObject* obj) {
  PyRef str(PyObject_Str(obj));
  if (!str) {
    PyErr_Clear();
    return "<unprintable>";
  }
  return UnicodeToString(str.get());
}

std::string ReprOf(PyObject* obj) {
  PyRef str(PyObject_Repr(obj));
  if (!str) {
    PyErr_Clear();
    return "<unprintable>";
  }
  return UnicodeToString(str.get());
}

// StringIO.getvalue(); empty if the snippet broke the buffer (e.g. closed it).
// Must not be called with an exception pending.
std::string BufferValue(PyObject* buf) {
  if (!buf || PyErr_Occurred()) return "";
  PyRef val(PyObject_CallMethod(buf, "getvalue", nullptr));
  if (!val || !PyUnicode_Check(val.get())) {
    PyErr_Clear();
    return "";
  }
  return UnicodeToString(val.get());
}

class JsonBridge {
  PyRef loads_, dumps_, dumps_kwargs_;
 public:
  bool Init() {
    PyRef mod(PyImport_ImportModule("json"));
    if (!mod) return false;
    loads_.reset(PyObject_GetAttrString(mod.get(), "loads"));
    dumps_.reset(PyObject_GetAttrString(mod.get(), "dumps"));
    dumps_kwargs_.reset(Py_BuildValue("{s:O}", "allow_nan", Py_False));
    return loads_ && dumps_ && dumps_kwargs_;
  }

  // new reference or nullptr with a Python exception set
  PyObject* ToPython(const nlohmann::json& val) {
    std::string text = val.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    PyRef str(PyUnicode_FromStringAndSize(text.data(), text.size()));
    if (!str) return nullptr;
    return PyObject_CallOneArg(loads_.get(), str.get());
  }

  // values that JSON cannot represent are reported by their repr()
  nlohmann::json FromPython(PyObject* obj) {
    PyRef args(PyTuple_Pack(1, obj));
    PyRef text(args ? PyObject_Call(dumps_.get(), args.get(), dumps_kwargs_.get()) : nullptr);
    if (text) {
      try {
        return nlohmann::json::parse(UnicodeToString(text.get()));
      } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Value not representable as JSON: {}", e.what());
      }
    } else {
      PyErr_Clear();
    }
    return ReprOf(obj);
  }
};

ErrorKind ClassifyException(PyObject* type) {
  if (PyErr_GivenExceptionMatches(type, PyExc_SyntaxError)) return ErrorKind::SYNTAX;
  if (PyErr_GivenExceptionMatches(type, PyExc_NameError)) return ErrorKind::NAME;
  if (PyErr_GivenExceptionMatches(type, PyExc_ZeroDivisionError)) return ErrorKind::ZERO_DIVISION;
  if (PyErr_GivenExceptionMatches(type, PyExc_ValueError)) return ErrorKind::VALUE;
  if (PyErr_GivenExceptionMatches(type, PyExc_MemoryError)) return ErrorKind::MEMORY_LIMIT;
  return ErrorKind::EXECUTION_FAILED;
}

std::string FormatTraceback(PyObject* type, PyObject* value, PyObject* tb) {
  PyRef mod(PyImport_ImportModule("traceback"));
  PyRef lines(mod ? PyObject_CallMethod(mod.get(), "format_exception", "OOO",
                                        type, value ? value : Py_None, tb ? tb : Py_None) : nullptr);
  PyRef sep(PyUnicode_FromString(""));
  PyRef joined(lines && sep ? PyUnicode_Join(sep.get(), lines.get()) : nullptr);
  if (!joined) {
    PyErr_Clear();
    return "";
  }
  return UnicodeToString(joined.get());
}

// Python exception fetched with PyErr_Fetch
struct PendingException {
  PyRef type, value, tb;

  // takes over the pending exception, leaving none set
  static PendingException Fetch() {
    PyObject *type = nullptr, *value = nullptr, *tb = nullptr;
    PyErr_Fetch(&type, &value, &tb);
    PyErr_NormalizeException(&type, &value, &tb);
    if (tb && value) PyException_SetTraceback(value, tb);
    return {PyRef(type), PyRef(value), PyRef(tb)};
  }
};

// Turn an exception into a failure outcome; stderr_text must already hold the captured stderr
void FillFailure(RawWorkerOutcome& outcome, const PendingException& exc) {
  PyObject* type = exc.type.get();
  PyObject* value = exc.value.get();
  if (!type) {
    outcome.error_kind = ErrorKindName(ErrorKind::EXECUTION_FAILED);
    outcome.error_message = "Unknown error";
    return;
  }
  if (terminated_type && PyErr_GivenExceptionMatches(type, terminated_type)) {
    // the reconciler reports the timeout itself
    outcome.error_kind = ErrorKindName(ErrorKind::TIMEOUT);
    outcome.error_message = "Terminated";
    return;
  }

  ErrorKind kind = ClassifyException(type);
  std::string message = value ? StrOf(value) : "";
  switch (kind) {
    case ErrorKind::MEMORY_LIMIT:
      message = "Memory limit exceeded: " + message;
      break;
    case ErrorKind::EXECUTION_FAILED:
      message = fmt::format("{}: {}", ((PyTypeObject*)type)->tp_name, message);
      break;
    default: break;
  }
  outcome.error_kind = ErrorKindName(kind);
  outcome.error_message = std::move(message);
  outcome.stderr_text += FormatTraceback(type, value, exc.tb.get());
  spdlog::debug("Snippet failed: {} {}", *outcome.error_kind, *outcome.error_message);
}

void FillFailure(RawWorkerOutcome& outcome) {
  FillFailure(outcome, PendingException::Fetch());
}

// New dict built from a JSON object, or nullptr with a Python exception set
PyObject* NamespaceFromJson(JsonBridge& bridge, const nlohmann::json& val, const char* name) {
  if (!val.is_object()) {
    PyErr_Format(PyExc_TypeError, "%s must be a mapping", name);
    return nullptr;
  }
  return bridge.ToPython(val);
}

void RunInInterpreter(const WorkerRequest& req, RawWorkerOutcome& outcome) {
  JsonBridge bridge;
  PyRef io(PyImport_ImportModule("io"));
  PyRef builtins(PyImport_ImportModule("builtins"));
  if (!io || !builtins || !bridge.Init() || !InstallTerminationHandler()) return FillFailure(outcome);

  PyRef out_buf(PyObject_CallMethod(io.get(), "StringIO", nullptr));
  PyRef err_buf(PyObject_CallMethod(io.get(), "StringIO", nullptr));
  if (!out_buf || !err_buf ||
      PySys_SetObject("stdout", out_buf.get()) < 0 ||
      PySys_SetObject("stderr", err_buf.get()) < 0) {
    return FillFailure(outcome);
  }
  auto collect_output = [&]() {
    outcome.stdout_text = BufferValue(out_buf.get());
    outcome.stderr_text = BufferValue(err_buf.get());
  };

  PyRef globals(req.request.initial_globals ?
      NamespaceFromJson(bridge, *req.request.initial_globals, "initial_globals") : PyDict_New());
  PyRef locals(req.request.initial_locals ?
      NamespaceFromJson(bridge, *req.request.initial_locals, "initial_locals") : PyDict_New());
  if (!globals || !locals) return FillFailure(outcome);
  if (!PyDict_GetItemString(globals.get(), "__builtins__") &&
      PyDict_SetItemString(globals.get(), "__builtins__", builtins.get()) < 0) {
    return FillFailure(outcome);
  }

  if (req.request.code.find('\0') != std::string::npos) {
    outcome.error_kind = ErrorKindName(ErrorKind::SYNTAX);
    outcome.error_message = "source code string cannot contain null bytes";
    return;
  }
  PyRef code(Py_CompileString(req.request.code.c_str(), kSnippetFilename, Py_file_input));
  PyRef result(code ? PyEval_EvalCode(code.get(), globals.get(), locals.get()) : nullptr);
  if (!result) {
    // getvalue() cannot run while the snippet's exception is pending
    auto exc = PendingException::Fetch();
    collect_output();
    return FillFailure(outcome, exc);
  }
  collect_output();
  outcome.success = true;

  if (req.request.capture_final_locals) {
    nlohmann::json final_locals = nlohmann::json::object();
    PyObject *key, *value;
    Py_ssize_t pos = 0;
    while (PyDict_Next(locals.get(), &pos, &key, &value)) {
      if (!PyUnicode_Check(key)) continue;
      std::string name = UnicodeToString(key);
      if (name.rfind("__", 0) == 0) continue;
      final_locals[name] = bridge.FromPython(value);
    }
    outcome.final_locals = std::move(final_locals);
  }
}

} // namespace

bool ApplyMemoryLimit(long memory_limit_mb) {
  struct rlimit lim;
  lim.rlim_cur = lim.rlim_max = (rlim_t)memory_limit_mb * 1024 * 1024;
  if (setrlimit(RLIMIT_AS, &lim) < 0) {
    spdlog::warn("Cannot apply memory limit of {} MB ({}); continuing without enforcement",
                 memory_limit_mb, strerror(errno));
    return false;
  }
  spdlog::debug("Memory limit set to {} MB", memory_limit_mb);
  return true;
}

std::optional<RawWorkerOutcome> RunSnippet(const WorkerRequest& req, bool memory_limit_applied) {
  PyConfig config;
  PyConfig_InitIsolatedConfig(&config);
  // SIGTERM gets our own handler in RunInInterpreter; SIGINT and the rest keep their defaults
  config.install_signal_handlers = 0;
  PyStatus status = Py_InitializeFromConfig(&config);
  PyConfig_Clear(&config);
  if (PyStatus_Exception(status)) {
    spdlog::error("Failed to initialize interpreter: {}", status.err_msg ? status.err_msg : "unknown error");
    return std::nullopt;
  }

  RawWorkerOutcome outcome;
  outcome.memory_limit_applied = memory_limit_applied;
  RunInInterpreter(req, outcome);

  outcome.memory_used_mb = PeakRssMb();
  // no Py_FinalizeEx: it would join threads the snippet left behind
  return outcome;
}
