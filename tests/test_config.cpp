#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>

TEST(Config, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.engine().connect_timeout, CONNECT_TIMEOUT_SECS);
    EXPECT_EQ(r.value.engine().pump_read_quantum, PUMP_READ_QUANTUM);
    EXPECT_EQ(r.value.engine().keepalive_interval, std::chrono::milliseconds(60000));
    EXPECT_TRUE(r.value.connections().empty());
    EXPECT_EQ(r.value.engine().staging_dir.filename().string(), STAGING_SUBDIR);
}

TEST(Config, EngineOverrides) {
    auto r = Config::parse(R"(
engine:
  staging_dir: /tmp/tb-stage
  connect_timeout: 10
  keepalive_interval: 1.5
  pump_poll_ms: 20
  pump_read_quantum: 4096
  delete_retries: 5
  delete_backoff_ms: 50
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& e = r.value.engine();
    EXPECT_EQ(e.staging_dir.string(), "/tmp/tb-stage");
    EXPECT_EQ(e.connect_timeout, 10);
    EXPECT_EQ(e.keepalive_interval, std::chrono::milliseconds(1500));
    EXPECT_EQ(e.pump_poll, std::chrono::milliseconds(20));
    EXPECT_EQ(e.pump_read_quantum, 4096);
    EXPECT_EQ(e.delete_retries, 5);
    EXPECT_EQ(e.delete_backoff, std::chrono::milliseconds(50));
}

TEST(Config, InvalidValuesFallBack) {
    auto r = Config::parse(R"(
engine:
  connect_timeout: 0
  pump_read_quantum: -1
  delete_retries: 0
)");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.engine().connect_timeout, CONNECT_TIMEOUT_SECS);
    EXPECT_EQ(r.value.engine().pump_read_quantum, PUMP_READ_QUANTUM);
    EXPECT_EQ(r.value.engine().delete_retries, 1);
}

TEST(Config, ConnectionProfiles) {
    auto r = Config::parse(R"(
connections:
  lab:
    host: lab.example.org
    port: 2222
    user: alice
    password: cHc=
  build:
    host: build.example.org
    user: ci
    auth: key
    key: /keys/id_ed25519
    passphrase: hunter2
)");
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto lab = r.value.connection("lab");
    ASSERT_TRUE(lab.is_ok());
    EXPECT_EQ(lab.value.host, "lab.example.org");
    EXPECT_EQ(lab.value.port, 2222);
    EXPECT_EQ(lab.value.auth_type, "password");
    EXPECT_EQ(lab.value.password, "cHc=");
    EXPECT_FALSE(lab.value.passphrase.has_value());

    auto build = r.value.connection("build");
    ASSERT_TRUE(build.is_ok());
    EXPECT_EQ(build.value.port, 22);
    EXPECT_EQ(build.value.auth_type, "key");
    EXPECT_EQ(build.value.private_key_path, "/keys/id_ed25519");
    ASSERT_TRUE(build.value.passphrase.has_value());
    EXPECT_EQ(*build.value.passphrase, "hunter2");
}

TEST(Config, UnknownProfile) {
    auto r = Config::defaults().connection("nope");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
}

TEST(Config, MalformedYaml) {
    auto r = Config::parse("engine: [unclosed");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::INVALID_INPUT);
}

TEST(Config, RootMustBeMapping) {
    auto r = Config::parse("- a\n- b\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::INVALID_INPUT);
}

TEST(Config, MissingFile) {
    auto r = Config::load_file("/nonexistent/termbridge/config.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
}
