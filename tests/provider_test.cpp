// Ember-Prod headers
#include "core/Errors.hpp"
#include "core/ProviderWaiter.hpp"
#include "providers/FileProvider.hpp"

// Ember-Fake headers
#include "CapturedLog.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <string>

namespace ember::test {

  using namespace std::chrono_literals;
  using core::ErrorKind;
  using core::ProvisionError;
  using providers::FileProvider;

  class FileProviderTest : public ::testing::Test {
  protected:
    ErrorKind fetchFailure(FileProvider& provider) {
      try {
        provider.fetchConfig();
      } catch (const ProvisionError& e) {
        return e.kind();
      }
      ADD_FAILURE() << "fetchConfig() succeeded";
      return ErrorKind::Count;
    }

    TempDir dir;
    CapturedLog log;
  };

  TEST_F(FileProviderTest, is_online_at_once_and_never_retried) {
    FileProvider provider(log.logger, dir / "config.ign");
    EXPECT_EQ(provider.name(), "file");
    EXPECT_TRUE(provider.isOnline());
    EXPECT_FALSE(provider.shouldRetry());
    EXPECT_EQ(provider.backoffDuration(), 0ms);
    EXPECT_NO_THROW(core::waitForProvider(provider, 10ms));
  }

  TEST_F(FileProviderTest, fetches_and_parses_the_file) {
    auto path = dir / "config.ign";
    std::ofstream(path) << R"({"ignitionVersion": 1, "systemd": {"units": []}})";
    FileProvider provider(log.logger, path);

    auto cfg = provider.fetchConfig();

    EXPECT_EQ(cfg.ignitionVersion, 1);
    EXPECT_TRUE(cfg.systemd.contains("units"));
    EXPECT_TRUE(log.contains(path.string()));
  }

  TEST_F(FileProviderTest, missing_file_is_a_fetch_failure) {
    FileProvider provider(log.logger, dir / "absent.ign");

    EXPECT_EQ(fetchFailure(provider), ErrorKind::FetchFailed);
    EXPECT_EQ(log.count(spdlog::level::err), 1);
  }

  TEST_F(FileProviderTest, foreign_documents_keep_their_classification) {
    auto path = dir / "user-data";
    std::ofstream(path) << "#cloud-config\nssh_authorized_keys: []\n";
    FileProvider provider(log.logger, path);

    EXPECT_EQ(fetchFailure(provider), ErrorKind::ConfigCloudConfig);
  }

  TEST_F(FileProviderTest, path_comes_from_the_environment) {
    ::unsetenv(FileProvider::kEnvVar);
    EXPECT_EQ(FileProvider::pathFromEnvironment().string(), FileProvider::kDefaultFilename);

    ::setenv(FileProvider::kEnvVar, "/usr/share/oem/config.ign", 1);
    EXPECT_EQ(FileProvider::pathFromEnvironment().string(), "/usr/share/oem/config.ign");

    ::setenv(FileProvider::kEnvVar, "", 1);
    EXPECT_EQ(FileProvider::pathFromEnvironment().string(), FileProvider::kDefaultFilename);
    ::unsetenv(FileProvider::kEnvVar);
  }

} // namespace ember::test
