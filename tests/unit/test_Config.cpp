#include <gtest/gtest.h>

#include "support/TestEnv.hpp"
#include "config/Config.hpp"

#include <cstdlib>
#include <fstream>

using namespace fdx;
using namespace fdx::config;

class ConfigTest : public ::testing::Test {
protected:
    test::TempDir dir{"filedex-config"};

    std::filesystem::path writeYaml(const std::string& body) const {
        const auto path = dir.path() / "config.yaml";
        std::ofstream out(path);
        out << body;
        return path;
    }
};

TEST_F(ConfigTest, Load_ParsesEverySection) {
    const auto cfg = loadConfig(writeYaml(R"(
database:
  backend: postgres
  host: db.internal
  port: 6543
  name: fdx
  user: svc
  pool_size: 8
caching:
  entry_ttl_seconds: 5
  max_keys: 42
auth:
  session_max_ttl_days: 14
  default_session_ttl_days: 2
storage:
  objects_path: /tmp/objects
auditing:
  trash_retention_days: 3
  sweep_interval_minutes: 1
logging:
  log_dir: /tmp/logs
)"));

    EXPECT_EQ(cfg.database.backend, StoreBackend::Postgres);
    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.port, 6543);
    EXPECT_EQ(cfg.database.pool_size, 8u);
    EXPECT_EQ(cfg.caching.entry_ttl, std::chrono::seconds(5));
    EXPECT_EQ(cfg.caching.list_ttl, std::chrono::seconds(60));
    EXPECT_EQ(cfg.caching.max_keys, 42u);
    EXPECT_EQ(cfg.auth.session_max_ttl, std::chrono::days(14));
    EXPECT_EQ(cfg.auth.default_session_ttl, std::chrono::days(2));
    EXPECT_EQ(cfg.storage.objects_path, "/tmp/objects");
    EXPECT_EQ(cfg.auditing.trash_retention, std::chrono::days(3));
    EXPECT_EQ(cfg.auditing.sweep_interval, std::chrono::minutes(1));
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/logs");
}

TEST_F(ConfigTest, Load_MissingSectionsKeepDefaults) {
    const auto cfg = loadConfig(writeYaml("database:\n  backend: memory\n"));

    EXPECT_EQ(cfg.database.backend, StoreBackend::Memory);
    EXPECT_EQ(cfg.database.host, "localhost");
    EXPECT_EQ(cfg.auth.session_max_ttl, std::chrono::days(30));
    EXPECT_EQ(cfg.auditing.trash_retention, std::chrono::days(30));
    EXPECT_EQ(cfg.caching.max_keys, 10000u);
}

TEST_F(ConfigTest, Load_RejectsDefaultTtlAboveMaximum) {
    EXPECT_THROW(loadConfig(writeYaml("auth:\n  session_max_ttl_days: 5\n  default_session_ttl_days: 6\n")),
                 std::invalid_argument);
}

TEST_F(ConfigTest, Load_RejectsUnknownBackend) {
    EXPECT_THROW(loadConfig(writeYaml("database:\n  backend: sqlite\n")), std::invalid_argument);
}

TEST_F(ConfigTest, Load_RejectsSectionThatIsNotAMap) {
    EXPECT_THROW(loadConfig(writeYaml("caching: 12\n")), std::invalid_argument);
}

TEST(DatabaseConfigTest, ConnectionString_PrefersEnvironmentPassword) {
    DatabaseConfig db;
    db.password = "from-file";

    unsetenv("FILEDEX_DB_PASSWORD");
    EXPECT_NE(db.connectionString().find("password=from-file"), std::string::npos);

    setenv("FILEDEX_DB_PASSWORD", "from-env", 1);
    EXPECT_NE(db.connectionString().find("password=from-env"), std::string::npos);
    unsetenv("FILEDEX_DB_PASSWORD");

    db.password.clear();
    EXPECT_EQ(db.connectionString().find("password="), std::string::npos);
}

TEST(DatabaseConfigTest, BackendNames) {
    EXPECT_EQ(storeBackendFromString("memory"), StoreBackend::Memory);
    EXPECT_EQ(to_string(StoreBackend::Postgres), "postgres");
    EXPECT_THROW(storeBackendFromString("Memory"), std::invalid_argument);
}
