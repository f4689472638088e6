#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <gtest/gtest.h>
#include <evalbox/execution.h>

// Limits used by tests unless a test is about the limits themselves
constexpr long kTestTimeout = 10;
constexpr long kTestMemoryMb = 512;

ExecutionResult RunCode(const std::string& code, long timeout = kTestTimeout,
                        long memory_mb = kTestMemoryMb, bool capture_final_locals = false);
ExecutionResult RunRequest(const ExecutionRequest& request, long timeout = kTestTimeout,
                           long memory_mb = kTestMemoryMb);

// gtest printable summary of a result for failure messages
std::string Describe(const ExecutionResult&);

::testing::AssertionResult Succeeded(const ExecutionResult&);
::testing::AssertionResult FailedWith(const ExecutionResult&, ErrorKind);

#endif // TEST_UTILS_H_
