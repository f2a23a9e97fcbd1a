#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "broker/config.hpp"
#include "test_fixtures.hpp"

namespace {

const char* const kManagedKeys[] = {
    "SERVER_PORT",         "LOG_LEVEL",        "APP_ENV",
    "GITHUB_CLIENT_ID",    "GH_CLIENT_ID",     "GITHUB_CLIENT_SECRET",
    "GH_CLIENT_SECRET",    "OAUTH_AUTHORIZE_URL", "OAUTH_TOKEN_URL",
    "OAUTH_SCOPE",         "OAUTH_API_URL",    "OAUTH_DEFAULT_PROJECT",
    "OAUTH_PROJECTS",      "ADDITIONAL_ORIGINS", "OAUTH_STATE_BYTES",
    "OAUTH_TOKEN_TIMEOUT_MS", "OAUTH_STRICT_PROJECTS", "OAUTH_PROJECT_REDIRECT",
};

class EnvConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* key : kManagedKeys) {
      const char* value = std::getenv(key);
      if (value) {
        saved_.emplace_back(key, value);
      }
      unsetenv(key);
    }
  }

  void TearDown() override {
    for (const char* key : kManagedKeys) {
      unsetenv(key);
    }
    for (const auto& entry : saved_) {
      setenv(entry.first.c_str(), entry.second.c_str(), 1);
    }
  }

  std::vector<std::pair<std::string, std::string>> saved_;
};

}  // namespace

TEST_F(EnvConfigTest, DefaultsMatchDevelopmentEnvironment) {
  auto cfg = broker::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 3000);
  EXPECT_FALSE(cfg.production);
  EXPECT_EQ(cfg.api_base_url, "http://localhost:3000");
  EXPECT_EQ(cfg.callback_path, "/oauth/callback");
  EXPECT_EQ(cfg.default_project, "create");
  EXPECT_EQ(cfg.provider.scope, "repo,user");
  EXPECT_EQ(cfg.state_bytes, 16u);
  EXPECT_EQ(cfg.cookie_max_age_seconds, 600u);
  EXPECT_EQ(cfg.state_cookie_name, "oauth_state");
  ASSERT_EQ(cfg.projects.size(), 2u);
  EXPECT_EQ(cfg.projects[0].id, "create");
  EXPECT_EQ(cfg.projects[0].frontend_origin, "http://localhost:5173");
  EXPECT_EQ(cfg.projects[1].id, "prompts");
  EXPECT_EQ(cfg.projects[1].frontend_origin, "http://localhost:5174");
}

TEST_F(EnvConfigTest, ProductionSwitchesDefaultUrls) {
  setenv("APP_ENV", "production", 1);
  auto cfg = broker::LoadConfigFromEnv();
  EXPECT_TRUE(cfg.production);
  EXPECT_EQ(cfg.api_base_url, "https://api.rbios.net");
  EXPECT_EQ(cfg.projects[0].frontend_origin, "https://create.rbios.net");
  EXPECT_EQ(cfg.projects[1].frontend_origin, "https://prompts.rbios.net");
}

TEST_F(EnvConfigTest, ReadsCredentialsWithFallbackNames) {
  setenv("GH_CLIENT_ID", "gh-id", 1);
  setenv("GITHUB_CLIENT_SECRET", "primary-secret", 1);
  setenv("GH_CLIENT_SECRET", "fallback-secret", 1);
  auto cfg = broker::LoadConfigFromEnv();
  EXPECT_EQ(cfg.provider.client_id, "gh-id");
  EXPECT_EQ(cfg.provider.client_secret, "primary-secret");
}

TEST_F(EnvConfigTest, ParsesProjectRegistryAndOrigins) {
  setenv("OAUTH_PROJECTS", "alpha=https://alpha.example.com, beta-2=https://beta.example.com", 1);
  setenv("OAUTH_DEFAULT_PROJECT", "alpha", 1);
  setenv("ADDITIONAL_ORIGINS", "https://x.example.com,, https://y.example.com ", 1);
  auto cfg = broker::LoadConfigFromEnv();
  ASSERT_EQ(cfg.projects.size(), 2u);
  EXPECT_EQ(cfg.projects[1].id, "beta-2");
  EXPECT_EQ(cfg.projects[1].frontend_origin, "https://beta.example.com");
  EXPECT_EQ(cfg.default_project, "alpha");
  std::vector<std::string> expected{"https://x.example.com", "https://y.example.com"};
  EXPECT_EQ(cfg.additional_origins, expected);
}

TEST_F(EnvConfigTest, RejectsProjectIdWithSeparator) {
  setenv("OAUTH_PROJECTS", "bad:id=https://bad.example.com", 1);
  EXPECT_THROW(broker::LoadConfigFromEnv(), broker::ConfigError);
}

TEST_F(EnvConfigTest, RejectsMalformedNumbers) {
  setenv("SERVER_PORT", "80a", 1);
  EXPECT_THROW(broker::LoadConfigFromEnv(), broker::ConfigError);
  setenv("SERVER_PORT", "70000", 1);
  EXPECT_THROW(broker::LoadConfigFromEnv(), broker::ConfigError);
}

TEST_F(EnvConfigTest, StateBytesHaveEntropyFloor) {
  setenv("OAUTH_STATE_BYTES", "8", 1);
  EXPECT_EQ(broker::LoadConfigFromEnv().state_bytes, 16u);
  setenv("OAUTH_STATE_BYTES", "32", 1);
  EXPECT_EQ(broker::LoadConfigFromEnv().state_bytes, 32u);
}

TEST_F(EnvConfigTest, RejectsNegativeAndOversizedStateBytes) {
  setenv("OAUTH_STATE_BYTES", "-1", 1);
  EXPECT_THROW(broker::LoadConfigFromEnv(), broker::ConfigError);
  setenv("OAUTH_STATE_BYTES", "257", 1);
  EXPECT_THROW(broker::LoadConfigFromEnv(), broker::ConfigError);
  setenv("OAUTH_STATE_BYTES", "18446744073709551615", 1);
  EXPECT_THROW(broker::LoadConfigFromEnv(), broker::ConfigError);
  setenv("OAUTH_STATE_BYTES", "0", 1);
  EXPECT_EQ(broker::LoadConfigFromEnv().state_bytes, 16u);
  setenv("OAUTH_STATE_BYTES", "256", 1);
  EXPECT_EQ(broker::LoadConfigFromEnv().state_bytes, 256u);
}

TEST_F(EnvConfigTest, TokenTimeoutMustBePositive) {
  for (const char* value : {"-1", "0", "+5", " 10", "120001"}) {
    setenv("OAUTH_TOKEN_TIMEOUT_MS", value, 1);
    EXPECT_THROW(broker::LoadConfigFromEnv(), broker::ConfigError) << value;
  }
  setenv("OAUTH_TOKEN_TIMEOUT_MS", "1", 1);
  EXPECT_EQ(broker::LoadConfigFromEnv().token_exchange_timeout_ms, 1u);
}

TEST(ConfigValidationTest, ValidConfigHasNoErrors) {
  EXPECT_TRUE(broker::ValidateConfig(broker_test::MakeTestConfig()).empty());
}

TEST(ConfigValidationTest, ListsBothMissingCredentials) {
  auto cfg = broker_test::MakeTestConfig();
  cfg.provider.client_id.clear();
  cfg.provider.client_secret.clear();
  auto errors = broker::ValidateConfig(cfg);
  std::vector<std::string> expected{"Missing GitHub Client ID", "Missing GitHub Client Secret"};
  EXPECT_EQ(errors, expected);
}

TEST(ConfigValidationTest, ReportsEmptyAllowList) {
  auto cfg = broker_test::MakeTestConfig();
  cfg.projects.clear();
  auto errors = broker::ValidateConfig(cfg);
  std::vector<std::string> expected{"No allowed origins configured", "Default project is not registered"};
  EXPECT_EQ(errors, expected);
}

TEST(ConfigValidationTest, ProjectIdCharacterSet) {
  EXPECT_TRUE(broker::IsValidProjectId("create"));
  EXPECT_TRUE(broker::IsValidProjectId("My_App-2"));
  EXPECT_FALSE(broker::IsValidProjectId(""));
  EXPECT_FALSE(broker::IsValidProjectId("a:b"));
  EXPECT_FALSE(broker::IsValidProjectId("a b"));
  EXPECT_FALSE(broker::IsValidProjectId(std::string(65, 'a')));
}

TEST(ConfigValidationTest, CallbackUrlIsProjectQualifiedOnlyWhenEnabled) {
  auto cfg = broker_test::MakeTestConfig();
  EXPECT_EQ(broker::BuildCallbackUrl(cfg, std::string("prompts")), "https://auth.example.com/oauth/callback");
  cfg.project_qualified_redirect = true;
  EXPECT_EQ(broker::BuildCallbackUrl(cfg, std::string("prompts")),
            "https://auth.example.com/oauth/callback?project=prompts");
  EXPECT_EQ(broker::BuildCallbackUrl(cfg, std::nullopt), "https://auth.example.com/oauth/callback");
}

TEST(ConfigValidationTest, CallbackUrlEncodesUntrustedProject) {
  auto cfg = broker_test::MakeTestConfig();
  cfg.project_qualified_redirect = true;
  EXPECT_EQ(broker::BuildCallbackUrl(cfg, std::string("a&b #c")),
            "https://auth.example.com/oauth/callback?project=a%26b%20%23c");
}
