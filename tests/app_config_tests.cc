#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <string>

#include "linkmint/app_config.h"
#include "linkmint/errors.h"
#include "test_util.h"

using linkmint::ConfigurationError;
using linkmint::app_config::AllocatorKind;
using linkmint::app_config::ReadOnlyAppConfig;
using linkmint::testing::TempDir;

namespace {

void WriteFile(const std::filesystem::path &path, const std::string &text) {
  std::ofstream f(path, std::ios::binary);
  f << text;
}

const char *const kEnvNames[] = {
    "LINKMINT__SECRET_KEY",       "LINKMINT__ALPHABET",
    "LINKMINT__ID_OFFSET",        "LINKMINT__MIN_TOKEN_LENGTH",
    "LINKMINT__ALLOCATOR",        "LINKMINT__FIRST_IDENTIFIER",
    "LINKMINT__URLS_DB_PATH",     "LINKMINT__PUBLIC_BASE_URL",
};

class EnvConfigTest : public ::testing::Test {
protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }
  static void ClearEnv() {
    for (const char *name : kEnvNames) {
      ::unsetenv(name);
    }
  }
  TempDir dir_;
};

} // namespace

TEST(AppConfig, YamlWithOnlyRequiredEntries) {
  TempDir dir;
  const auto yaml = dir.path() / "linkmint.yaml";
  WriteFile(yaml, "secret_key: \"s3cret\"\n"
                  "urls_db_path: \"" +
                      (dir.path() / "urls").string() + "\"\n");
  auto config = ReadOnlyAppConfig::new_from_yaml(yaml);
  EXPECT_EQ(config->secret_key, "s3cret");
  EXPECT_EQ(config->alphabet, linkmint::token::default_alphabet);
  EXPECT_EQ(config->id_offset, 14'000'000u);
  EXPECT_EQ(config->min_token_length, 0);
  EXPECT_EQ(config->allocator, AllocatorKind::RocksDb);
  EXPECT_EQ(config->first_identifier, 1u);
  EXPECT_EQ(config->public_base_url, "http://localhost:3000/");
}

TEST(AppConfig, YamlOverridesEverything) {
  TempDir dir;
  const auto yaml = dir.path() / "linkmint.yaml";
  WriteFile(yaml, "secret_key: k\n"
                  "alphabet: \"0123456789\"\n"
                  "id_offset: 1000\n"
                  "min_token_length: 4\n"
                  "allocator: memory\n"
                  "first_identifier: 0\n"
                  "public_base_url: \"https://s.example/\"\n"
                  "urls_db_path: \"" +
                      (dir.path() / "urls").string() + "\"\n");
  auto config = ReadOnlyAppConfig::new_from_yaml(yaml);
  EXPECT_EQ(config->alphabet, "0123456789");
  EXPECT_EQ(config->id_offset, 1000u);
  EXPECT_EQ(config->min_token_length, 4);
  EXPECT_EQ(config->allocator, AllocatorKind::Memory);
  EXPECT_EQ(config->first_identifier, 0u);
  EXPECT_EQ(config->public_base_url, "https://s.example/");
}

TEST(AppConfig, YamlMissingSecretKey) {
  TempDir dir;
  const auto yaml = dir.path() / "linkmint.yaml";
  WriteFile(yaml, "urls_db_path: \"" + (dir.path() / "urls").string() +
                      "\"\n");
  EXPECT_THROW(ReadOnlyAppConfig::new_from_yaml(yaml), ConfigurationError);
}

TEST(AppConfig, YamlRejectsDuplicateAlphabetSymbols) {
  TempDir dir;
  const auto yaml = dir.path() / "linkmint.yaml";
  WriteFile(yaml, "secret_key: k\nalphabet: \"abca\"\nurls_db_path: \"" +
                      (dir.path() / "urls").string() + "\"\n");
  EXPECT_THROW(ReadOnlyAppConfig::new_from_yaml(yaml), ConfigurationError);
}

TEST(AppConfig, YamlRejectsNonNumericOffset) {
  TempDir dir;
  const auto yaml = dir.path() / "linkmint.yaml";
  WriteFile(yaml, "secret_key: k\nid_offset: lots\nurls_db_path: \"" +
                      (dir.path() / "urls").string() + "\"\n");
  EXPECT_THROW(ReadOnlyAppConfig::new_from_yaml(yaml), ConfigurationError);
}

TEST(AppConfig, UnreadableYamlFile) {
  TempDir dir;
  EXPECT_THROW(ReadOnlyAppConfig::new_from_yaml(dir.path() / "missing.yaml"),
               ConfigurationError);
}

TEST(AppConfig, ParseAllocatorKind) {
  EXPECT_EQ(linkmint::app_config::parse_allocator_kind("rocksdb"),
            AllocatorKind::RocksDb);
  EXPECT_EQ(linkmint::app_config::parse_allocator_kind("memory"),
            AllocatorKind::Memory);
  EXPECT_THROW(linkmint::app_config::parse_allocator_kind("redis"),
               ConfigurationError);
}

TEST_F(EnvConfigTest, RequiresSecretKey) {
  ::setenv("LINKMINT__URLS_DB_PATH", (dir_.path() / "urls").c_str(), 1);
  EXPECT_THROW(ReadOnlyAppConfig::new_from_env(), ConfigurationError);
  ::setenv("LINKMINT__SECRET_KEY", "", 1);
  EXPECT_THROW(ReadOnlyAppConfig::new_from_env(), ConfigurationError);
}

TEST_F(EnvConfigTest, RequiresDatabasePath) {
  ::setenv("LINKMINT__SECRET_KEY", "k", 1);
  EXPECT_THROW(ReadOnlyAppConfig::new_from_env(), ConfigurationError);
}

TEST_F(EnvConfigTest, ReadsAllVariables) {
  ::setenv("LINKMINT__SECRET_KEY", "from-env", 1);
  ::setenv("LINKMINT__URLS_DB_PATH", (dir_.path() / "urls").c_str(), 1);
  ::setenv("LINKMINT__ALPHABET", "abcdef", 1);
  ::setenv("LINKMINT__ID_OFFSET", "216", 1);
  ::setenv("LINKMINT__MIN_TOKEN_LENGTH", "4", 1);
  ::setenv("LINKMINT__ALLOCATOR", "memory", 1);
  ::setenv("LINKMINT__FIRST_IDENTIFIER", "10", 1);
  ::setenv("LINKMINT__PUBLIC_BASE_URL", "https://l.example/", 1);
  auto config = ReadOnlyAppConfig::new_from_env();
  EXPECT_EQ(config->secret_key, "from-env");
  EXPECT_EQ(config->alphabet, "abcdef");
  EXPECT_EQ(config->id_offset, 216u);
  EXPECT_EQ(config->min_token_length, 4);
  EXPECT_EQ(config->allocator, AllocatorKind::Memory);
  EXPECT_EQ(config->first_identifier, 10u);
  EXPECT_EQ(config->urls_db_path, dir_.path() / "urls");
  EXPECT_EQ(config->public_base_url, "https://l.example/");
}

TEST_F(EnvConfigTest, RejectsBadNumbers) {
  ::setenv("LINKMINT__SECRET_KEY", "k", 1);
  ::setenv("LINKMINT__URLS_DB_PATH", (dir_.path() / "urls").c_str(), 1);
  ::setenv("LINKMINT__ID_OFFSET", "-5", 1);
  EXPECT_THROW(ReadOnlyAppConfig::new_from_env(), ConfigurationError);
  ::setenv("LINKMINT__ID_OFFSET", "5", 1);
  ::setenv("LINKMINT__MIN_TOKEN_LENGTH", "300", 1);
  EXPECT_THROW(ReadOnlyAppConfig::new_from_env(), ConfigurationError);
}

TEST_F(EnvConfigTest, RejectsUnwritableDatabaseDirectory) {
  ::setenv("LINKMINT__SECRET_KEY", "k", 1);
  ::setenv("LINKMINT__URLS_DB_PATH",
           (dir_.path() / "does-not-exist" / "urls").c_str(), 1);
  EXPECT_THROW(ReadOnlyAppConfig::new_from_env(), ConfigurationError);
}
