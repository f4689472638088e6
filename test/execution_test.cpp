#include <vector>
#include <algorithm>

#include <fmt/format.h>
#include <evalbox/paths.h>
#include <evalbox/utils.h>

#include "utils.h"

namespace {

struct FailureParam {
  const char* name;
  std::string code;
  ErrorKind kind;
  std::string message_part;
};

std::string ParamName(const ::testing::TestParamInfo<FailureParam>& info) {
  return info.param.name;
}

} // namespace

TEST(ExecutionTest, WorkerAvailable) {
  ASSERT_TRUE(WorkerAvailable()) << WorkerPath();
}

TEST(ExecutionTest, HelloWorld) {
  auto res = RunCode("print('Hello, World!')");
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(res.captured_stdout, "Hello, World!\n");
  EXPECT_EQ(res.captured_stderr, "");
  EXPECT_FALSE(res.final_locals);
  EXPECT_GE(res.execution_time_seconds, 0);
  EXPECT_LT(res.execution_time_seconds, kTestTimeout);
  EXPECT_GT(res.memory_used_mb, 0);
}

TEST(ExecutionTest, CaptureLocals) {
  auto res = RunCode("result = 21 * 2", kTestTimeout, kTestMemoryMb, true);
  ASSERT_TRUE(Succeeded(res));
  ASSERT_TRUE(res.final_locals);
  EXPECT_EQ(*res.final_locals, nlohmann::json({{"result", 42}}));
}

TEST(ExecutionTest, ManyLines) {
  constexpr int kLines = 1000;
  auto res = RunCode(fmt::format("for i in range({}):\n    print(i)", kLines));
  ASSERT_TRUE(Succeeded(res));
  std::string expected;
  for (int i = 0; i < kLines; i++) expected += fmt::format("{}\n", i);
  EXPECT_EQ(res.captured_stdout, expected);
}

TEST(ExecutionTest, StderrCaptured) {
  auto res = RunCode("import sys\nsys.stderr.write('warn\\n')\nprint('ok')");
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(res.captured_stdout, "ok\n");
  EXPECT_EQ(res.captured_stderr, "warn\n");
}

TEST(ExecutionTest, ExecutionsAreIndependent) {
  auto first = RunCode("x = 1\nimport sys\nsys.marker = True", kTestTimeout, kTestMemoryMb, true);
  ASSERT_TRUE(Succeeded(first));
  EXPECT_EQ(first.final_locals->at("x"), 1);

  auto second = RunCode("y = 2\nimport sys\nmarked = hasattr(sys, 'marker')", kTestTimeout, kTestMemoryMb, true);
  ASSERT_TRUE(Succeeded(second));
  EXPECT_FALSE(second.final_locals->contains("x"));
  EXPECT_EQ(second.final_locals->at("y"), 2);
  EXPECT_EQ(second.final_locals->at("marked"), false);

  EXPECT_TRUE(FailedWith(RunCode("print(x)"), ErrorKind::NAME));
}

TEST(ExecutionTest, SyntaxErrorIsQuick) {
  auto res = RunCode("print('unclosed'", 30);
  ASSERT_TRUE(FailedWith(res, ErrorKind::SYNTAX));
  EXPECT_LT(res.execution_time_seconds, 30);
  EXPECT_EQ(res.captured_stdout, "");
}

TEST(ExecutionTest, NullByteIsSyntaxError) {
  EXPECT_TRUE(FailedWith(RunCode(std::string("x = 1\0", 6)), ErrorKind::SYNTAX));
}

class ExecutionFailure : public testing::TestWithParam<FailureParam> {};
TEST_P(ExecutionFailure, Classify) {
  auto& param = GetParam();
  auto res = RunCode(param.code);
  ASSERT_TRUE(FailedWith(res, param.kind));
  EXPECT_NE(res.error->message.find(param.message_part), std::string::npos) << res.error->message;
}
INSTANTIATE_TEST_SUITE_P(Failures, ExecutionFailure,
    testing::Values(
      (FailureParam){"ZeroDivision", "1 / 0", ErrorKind::ZERO_DIVISION, "division by zero"},
      (FailureParam){"Syntax", "def f(:\n  pass", ErrorKind::SYNTAX, ""},
      (FailureParam){"Indentation", "if True:\nprint(1)", ErrorKind::SYNTAX, ""},
      (FailureParam){"Name", "undefined_name + 1", ErrorKind::NAME, "undefined_name"},
      (FailureParam){"Value", "int('abc')", ErrorKind::VALUE, "invalid literal"},
      (FailureParam){"Other", "raise KeyError('missing')", ErrorKind::EXECUTION_FAILED, "KeyError: 'missing'"},
      (FailureParam){"Type", "'a' + 1", ErrorKind::EXECUTION_FAILED, "TypeError:"},
      (FailureParam){"SystemExit", "raise SystemExit(2)", ErrorKind::EXECUTION_FAILED, "SystemExit: 2"},
      (FailureParam){"SysExit", "import sys\nsys.exit(0)", ErrorKind::EXECUTION_FAILED, "SystemExit"}
    ),
    ParamName);

TEST(ExecutionTest, PartialOutputOnFailure) {
  auto res = RunCode("print('before')\n1 / 0\nprint('after')");
  ASSERT_TRUE(FailedWith(res, ErrorKind::ZERO_DIVISION));
  EXPECT_EQ(res.captured_stdout, "before\n");
  EXPECT_NE(res.captured_stderr.find("Traceback"), std::string::npos);
  EXPECT_NE(res.captured_stderr.find("ZeroDivisionError"), std::string::npos);
}

TEST(ExecutionTest, PartialStderrKeptBeforeTraceback) {
  auto res = RunCode("import sys\nprint('out')\nsys.stderr.write('err\\n')\nundefined_name");
  ASSERT_TRUE(FailedWith(res, ErrorKind::NAME));
  EXPECT_EQ(res.error->message, "name 'undefined_name' is not defined");
  EXPECT_EQ(res.captured_stdout, "out\n");
  EXPECT_EQ(res.captured_stderr.rfind("err\nTraceback", 0), 0u) << res.captured_stderr;
  EXPECT_NE(res.captured_stderr.find("NameError"), std::string::npos);
}

TEST(ExecutionTest, NoLocalsOnFailure) {
  auto res = RunCode("a = 1\nraise ValueError('bad')", kTestTimeout, kTestMemoryMb, true);
  ASSERT_TRUE(FailedWith(res, ErrorKind::VALUE));
  EXPECT_EQ(res.error->message, "bad");
  EXPECT_FALSE(res.final_locals);
}

TEST(ExecutionTest, MemoryLimit) {
  if (!MemoryLimitSupported()) GTEST_SKIP() << "address space limit not supported";
  auto res = RunCode("print('start')\nx = bytearray(4 * 1024 ** 3)", kTestTimeout, 256);
  ASSERT_TRUE(FailedWith(res, ErrorKind::MEMORY_LIMIT));
  EXPECT_EQ(res.error->message.rfind("Memory limit exceeded: ", 0), 0u) << res.error->message;
  EXPECT_EQ(res.captured_stdout, "start\n");
}

TEST(ExecutionTest, WithinMemoryLimit) {
  auto res = RunCode("x = bytearray(16 * 1024 ** 2)\nprint(len(x))", kTestTimeout, 256);
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(res.captured_stdout, "16777216\n");
  EXPECT_EQ(res.memory_limit_applied, MemoryLimitSupported());
}

TEST(ExecutionTest, MemoryUsageIsTheWorkersOwn) {
  auto small = RunCode("pass");
  ASSERT_TRUE(Succeeded(small));
  // resident pages of the launching process are not the snippet's
  std::vector<char> ballast(400 * 1024 * 1024);
  for (size_t i = 0; i < ballast.size(); i += 4096) ballast[i] = 1;
  auto res = RunCode("pass");
  ASSERT_TRUE(Succeeded(res));
  EXPECT_GT(res.memory_used_mb, 0);
  EXPECT_LT(res.memory_used_mb, 200);
  EXPECT_LT(res.memory_used_mb, small.memory_used_mb + 50);

  EXPECT_EQ(ballast[4096], 1);

  auto big = RunCode("x = b'x' * (100 * 1024 ** 2)", kTestTimeout, kTestMemoryMb);
  ASSERT_TRUE(Succeeded(big));
  EXPECT_GT(big.memory_used_mb, small.memory_used_mb + 90);
}

TEST(ExecutionTest, ExitWithoutOutcome) {
  auto res = RunCode("print('gone')\nimport os\nos._exit(3)");
  ASSERT_TRUE(FailedWith(res, ErrorKind::EXECUTION_FAILED));
  EXPECT_NE(res.error->message.find("without error message"), std::string::npos) << res.error->message;
  EXPECT_NE(res.error->message.find("exited with status 3"), std::string::npos) << res.error->message;
}

TEST(ExecutionTest, KilledWithoutOutcome) {
  auto res = RunCode("import os, signal\nos.kill(os.getpid(), signal.SIGKILL)");
  ASSERT_TRUE(FailedWith(res, ErrorKind::EXECUTION_FAILED));
  EXPECT_NE(res.error->message.find("killed by signal 9"), std::string::npos) << res.error->message;
}

TEST(ExecutionTest, WritesToRealStdoutDoNotCorruptOutcome) {
  auto res = RunCode("import os\nos.write(1, b'\\x00garbage')\nprint('fine')");
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(res.captured_stdout, "fine\n");
}

TEST(ExecutionTest, InvalidUtf8Output) {
  auto res = RunCode("print('\\udcff')");
  // the lone surrogate must not break the result channel
  ASSERT_TRUE(Succeeded(res));
  EXPECT_FALSE(res.captured_stdout.empty());
}

TEST(ExecutionTest, InjectedNamespaces) {
  ExecutionRequest req("c = a * b\nprint(c)", true);
  req.initial_globals = nlohmann::json({{"a", 6}});
  req.initial_locals = nlohmann::json({{"b", 7}});
  auto res = RunRequest(req);
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(res.captured_stdout, "42\n");
  ASSERT_TRUE(res.final_locals);
  EXPECT_EQ(res.final_locals->at("b"), 7);
  EXPECT_EQ(res.final_locals->at("c"), 42);
  // globals are not part of the final locals
  EXPECT_FALSE(res.final_locals->contains("a"));
}

TEST(ExecutionTest, InjectedStructuredValues) {
  ExecutionRequest req("total = sum(data['values'])\nname = data['name'].upper()", true);
  req.initial_globals = nlohmann::json({{"data", {{"values", {1, 2, 3}}, {"name", "box"}}}});
  auto res = RunRequest(req);
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(res.final_locals->at("total"), 6);
  EXPECT_EQ(res.final_locals->at("name"), "BOX");
}

TEST(ExecutionTest, DunderNamesFiltered) {
  auto res = RunCode("__hidden = 1\n_single = 2\nvisible = 3", kTestTimeout, kTestMemoryMb, true);
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(*res.final_locals, nlohmann::json({{"_single", 2}, {"visible", 3}}));
}

TEST(ExecutionTest, NonJsonValuesAsRepr) {
  auto res = RunCode("s = {1}\nn = float('nan')\nt = (1, 'a')\nf = 1.5\nz = None",
                     kTestTimeout, kTestMemoryMb, true);
  ASSERT_TRUE(Succeeded(res));
  auto& locals = *res.final_locals;
  EXPECT_EQ(locals.at("s"), "{1}");
  EXPECT_EQ(locals.at("n"), "nan");
  EXPECT_EQ(locals.at("t"), nlohmann::json({1, "a"}));
  EXPECT_EQ(locals.at("f"), 1.5);
  EXPECT_TRUE(locals.at("z").is_null());
}

TEST(ExecutionPoolTest, Concurrent) {
  constexpr int kRequests = 8;
  ExecutionPool pool(4);
  std::vector<std::future<ExecutionResult>> futures;
  for (int i = 0; i < kRequests; i++) {
    futures.push_back(pool.Submit(ExecutorConfig(kTestTimeout, kTestMemoryMb),
        ExecutionRequest(fmt::format("import time\ntime.sleep(0.2)\nprint({})", i))));
  }
  for (int i = 0; i < kRequests; i++) {
    auto res = futures[i].get();
    ASSERT_TRUE(Succeeded(res));
    EXPECT_EQ(res.captured_stdout, fmt::format("{}\n", i));
  }
  EXPECT_EQ(pool.QueueSize(), 0u);
}

TEST(ExecutionPoolTest, PendingTasksFinishOnShutdown) {
  std::future<ExecutionResult> last;
  {
    ExecutionPool pool(1);
    pool.Submit(ExecutorConfig(kTestTimeout, kTestMemoryMb), ExecutionRequest("pass"));
    last = pool.Submit(ExecutorConfig(kTestTimeout, kTestMemoryMb), ExecutionRequest("print('last')"));
  }
  auto res = last.get();
  ASSERT_TRUE(Succeeded(res));
  EXPECT_EQ(res.captured_stdout, "last\n");
}

TEST(ExecutionTest, MissingWorker) {
  fs::path orig = internal::kDataDir;
  internal::kDataDir = "/nonexistent/evalbox";
  EXPECT_FALSE(WorkerAvailable());
  auto res = RunCode("print(1)");
  internal::kDataDir = orig;
  EXPECT_TRUE(FailedWith(res, ErrorKind::EXECUTION_FAILED));
}
