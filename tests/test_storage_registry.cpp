#include <gtest/gtest.h>
#include <persistency/app_data_dir.hpp>
#include <persistency/storage_registry.hpp>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include "temp_dir.hpp"

using persistency::DefaultAppDataDir;
using persistency::ResolveAppDataDir;
using persistency::StorageConfig;
using persistency::StorageRegistry;
using studio::core::StorageErrc;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
  EnvGuard(const char* name, const char* value) : name_(name) {
    if (const char* old = std::getenv(name)) old_ = std::string(old);
    if (value) ::setenv(name, value, 1); else ::unsetenv(name);
  }
  ~EnvGuard() {
    if (old_) ::setenv(name_, old_->c_str(), 1); else ::unsetenv(name_);
  }
private:
  const char* name_;
  std::optional<std::string> old_;
};

} // namespace

class StorageRegistryTest : public ::testing::Test {
protected:
  void TearDown() override { StorageRegistry::Instance().Clear(); }
};

TEST_F(StorageRegistryTest, LoadsManifestFromFile) {
  TempDir dir;
  const auto manifest = dir.path() / "studio.json";
  {
    std::ofstream out(manifest);
    out << R"({"applications":[
      {"app_id":"studio","identifier":"dev.studio.desktop","log_level":"debug"},
      {"app_id":"tool","data_dir":"/srv/tool","log_file":"/var/log/tool.log"}]})";
  }

  ASSERT_TRUE(StorageRegistry::Instance().InitFromFile(manifest.string()).HasValue());
  ASSERT_TRUE(StorageRegistry::Instance().IsInitialized());

  auto studio = StorageRegistry::Instance().Lookup("studio");
  ASSERT_TRUE(studio.has_value());
  EXPECT_EQ(studio->identifier, "dev.studio.desktop");
  EXPECT_EQ(studio->log_level, "debug");
  EXPECT_TRUE(studio->data_dir.empty());

  auto tool = StorageRegistry::Instance().Lookup("tool");
  ASSERT_TRUE(tool.has_value());
  EXPECT_EQ(tool->identifier, "tool");   // defaults to app_id
  EXPECT_EQ(tool->data_dir, "/srv/tool");
  EXPECT_EQ(tool->log_level, "info");
  EXPECT_EQ(tool->log_file, "/var/log/tool.log");

  EXPECT_FALSE(StorageRegistry::Instance().Lookup("missing").has_value());
}

TEST_F(StorageRegistryTest, MissingFileIsConfigError) {
  auto r = StorageRegistry::Instance().InitFromFile("/nonexistent/studio.json");
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, StorageErrc::kConfig);
  EXPECT_FALSE(StorageRegistry::Instance().IsInitialized());
}

TEST_F(StorageRegistryTest, MalformedManifestIsConfigError) {
  for (const char* text : {"{not json", R"({"apps":[]})", R"({"applications":[{"identifier":"x"}]})",
                           R"({"applications":[{"app_id":7}]})", R"({"applications":[{"app_id":""}]})"}) {
    SCOPED_TRACE(text);
    auto r = StorageRegistry::Instance().InitFromString(text);
    ASSERT_FALSE(r.HasValue());
    EXPECT_EQ(r.Error().value, StorageErrc::kConfig);
    EXPECT_FALSE(StorageRegistry::Instance().IsInitialized());
  }
}

TEST_F(StorageRegistryTest, ReloadReplacesEntries) {
  ASSERT_TRUE(StorageRegistry::Instance().InitFromString(R"({"applications":[{"app_id":"a"}]})").HasValue());
  ASSERT_TRUE(StorageRegistry::Instance().InitFromString(R"({"applications":[{"app_id":"b"}]})").HasValue());
  EXPECT_FALSE(StorageRegistry::Instance().Lookup("a").has_value());
  EXPECT_TRUE(StorageRegistry::Instance().Lookup("b").has_value());
}

TEST(AppDataDir, ExplicitDataDirWins) {
  StorageConfig cfg;
  cfg.identifier = "dev.studio.desktop";
  cfg.data_dir = "/opt/studio-data";
  auto r = ResolveAppDataDir(cfg);
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), "/opt/studio-data");
}

TEST(AppDataDir, RejectsUnsafeIdentifiers) {
  for (const char* id : {"", "../escape", "a/b"}) {
    SCOPED_TRACE(id);
    auto r = DefaultAppDataDir(id);
    ASSERT_FALSE(r.HasValue());
    EXPECT_EQ(r.Error().value, StorageErrc::kConfig);
  }
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST(AppDataDir, FollowsXdgDataHome) {
  EnvGuard xdg("XDG_DATA_HOME", "/xdg/data");
  auto r = DefaultAppDataDir("dev.studio.desktop");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), "/xdg/data/dev.studio.desktop");
}

TEST(AppDataDir, FallsBackToHomeLocalShare) {
  EnvGuard xdg("XDG_DATA_HOME", nullptr);
  EnvGuard home("HOME", "/home/tester");
  auto r = DefaultAppDataDir("dev.studio.desktop");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), "/home/tester/.local/share/dev.studio.desktop");
}

TEST(AppDataDir, NoHomeIsConfigError) {
  EnvGuard xdg("XDG_DATA_HOME", nullptr);
  EnvGuard home("HOME", nullptr);
  auto r = DefaultAppDataDir("dev.studio.desktop");
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, StorageErrc::kConfig);
}
#endif
