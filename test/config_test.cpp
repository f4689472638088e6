#include <gtest/gtest.h>
#include <evalbox/config.h>

namespace {

struct ConfigParam {
  const char* name;
  long timeout_seconds;
  long memory_limit_mb;
  bool valid;
};

std::string ParamName(const ::testing::TestParamInfo<ConfigParam>& info) {
  return info.param.name;
}

} // namespace

TEST(ExecutorConfigTest, Defaults) {
  ExecutorConfig config;
  EXPECT_EQ(config.timeout_seconds(), 300);
  EXPECT_EQ(config.memory_limit_mb(), 1024);
}

class ExecutorConfigValidation : public testing::TestWithParam<ConfigParam> {};
TEST_P(ExecutorConfigValidation, Construct) {
  auto& param = GetParam();
  if (param.valid) {
    ExecutorConfig config(param.timeout_seconds, param.memory_limit_mb);
    EXPECT_EQ(config.timeout_seconds(), param.timeout_seconds);
    EXPECT_EQ(config.memory_limit_mb(), param.memory_limit_mb);
  } else {
    EXPECT_THROW(ExecutorConfig(param.timeout_seconds, param.memory_limit_mb), ConfigurationError);
  }
}
INSTANTIATE_TEST_SUITE_P(Config, ExecutorConfigValidation,
    testing::Values(
      (ConfigParam){"Minimal", 1, 1, true},
      (ConfigParam){"Typical", 30, 512, true},
      (ConfigParam){"ZeroTimeout", 0, 512, false},
      (ConfigParam){"NegativeTimeout", -5, 512, false},
      (ConfigParam){"ZeroMemory", 30, 0, false},
      (ConfigParam){"NegativeMemory", 30, -1, false}
    ),
    ParamName);

TEST(ExecutorConfigTest, ErrorMessage) {
  try {
    ExecutorConfig config(-3, 10);
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& err) {
    EXPECT_STREQ(err.what(), "Timeout must be positive, got -3");
  }
  try {
    ExecutorConfig config(10, 0);
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& err) {
    EXPECT_STREQ(err.what(), "Memory limit must be positive, got 0");
  }
}
