#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

static EnvLookup env_from(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

static Config parse_ok(const std::string& yaml) {
    auto r = Config::parse(yaml);
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

TEST(ConfigResolve, CompiledDefaults) {
    RunOptions o = Config{}.resolve(env_from({}));
    EXPECT_EQ(o.host, "devbox");
    EXPECT_EQ(o.remote, DEFAULT_REMOTE);
    EXPECT_EQ(o.credential_helper, DEFAULT_CREDENTIAL_HELPER);
    EXPECT_EQ(o.ssh_program, "ssh");
    EXPECT_TRUE(o.ssh_args.empty());
    EXPECT_EQ(o.socket_policy, SocketPolicy::Infer);
    EXPECT_EQ(o.keychain_service, "AspectWorkflows");
    EXPECT_EQ(o.key_prefix, "keyring-rs");
    EXPECT_EQ(o.keychain_backend, "system");
    EXPECT_FALSE(o.session_keyring);
    EXPECT_TRUE(o.verify_after_push);
    EXPECT_FALSE(o.force_local);
    EXPECT_FALSE(o.force_remote);
}

TEST(ConfigResolve, FileOverridesDefaults) {
    Config c = parse_ok(
        "host: build-01\n"
        "remote: aw.example.com\n"
        "credential_helper: /opt/bin/helper\n"
        "session_keyring: true\n"
        "verify_after_push: false\n"
        "ssh:\n"
        "  program: /usr/bin/ssh\n"
        "  args: [\"-p\", \"2222\"]\n"
        "  create_socket: false\n"
        "keychain:\n"
        "  service: OtherService\n"
        "  key_prefix: custom\n"
        "  backend: file\n"
        "  file: /tmp/creds\n");

    RunOptions o = c.resolve(env_from({}));
    EXPECT_EQ(o.host, "build-01");
    EXPECT_EQ(o.remote, "aw.example.com");
    EXPECT_EQ(o.credential_helper, "/opt/bin/helper");
    EXPECT_TRUE(o.session_keyring);
    EXPECT_FALSE(o.verify_after_push);
    EXPECT_EQ(o.ssh_program, "/usr/bin/ssh");
    EXPECT_EQ(o.ssh_args, (std::vector<std::string>{"-p", "2222"}));
    EXPECT_EQ(o.socket_policy, SocketPolicy::ReuseAlways);
    EXPECT_EQ(o.keychain_service, "OtherService");
    EXPECT_EQ(o.key_prefix, "custom");
    EXPECT_EQ(o.keychain_backend, "file");
    EXPECT_EQ(o.credentials_file.string(), "/tmp/creds");
}

TEST(ConfigResolve, EnvironmentOverridesFile) {
    Config c = parse_ok("remote: from-file\ncredential_helper: file-helper\n");
    RunOptions o = c.resolve(env_from({
        {"ASPECT_REMOTE", "from-env"},
        {"ASPECT_CREDENTIAL_HELPER", "env-helper"},
    }));
    EXPECT_EQ(o.remote, "from-env");
    EXPECT_EQ(o.credential_helper, "env-helper");
}

TEST(ConfigResolve, EmptyEnvironmentValueIgnored) {
    Config c = parse_ok("remote: from-file\n");
    RunOptions o = c.resolve(env_from({{"ASPECT_REMOTE", ""}}));
    EXPECT_EQ(o.remote, "from-file");
}

TEST(ConfigParse, CreateSocketInfer) {
    Config c = parse_ok("ssh:\n  create_socket: infer\n");
    ASSERT_TRUE(c.create_socket().has_value());
    EXPECT_EQ(*c.create_socket(), SocketPolicy::Infer);
}

TEST(ConfigParse, CreateSocketYes) {
    Config c = parse_ok("ssh:\n  create_socket: yes\n");
    EXPECT_EQ(c.create_socket(), SocketPolicy::CreateAlways);
}

TEST(ConfigParse, ScalarSshArgs) {
    Config c = parse_ok("ssh:\n  args: -oStrictHostKeyChecking=no\n");
    EXPECT_EQ(c.ssh_args(), (std::vector<std::string>{"-oStrictHostKeyChecking=no"}));
}

TEST(ConfigParse, EmptyDocument) {
    Config c = parse_ok("");
    EXPECT_FALSE(c.remote().has_value());
    EXPECT_FALSE(c.host().has_value());
}

TEST(ConfigParse, RejectsBadCreateSocket) {
    auto r = Config::parse("ssh:\n  create_socket: sometimes\n", "test.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("test.yaml"), std::string::npos);
    EXPECT_NE(r.error.find("sometimes"), std::string::npos);
}

TEST(ConfigParse, RejectsNonMapping) {
    auto r = Config::parse("- a\n- b\n", "list.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("list.yaml"), std::string::npos);
}

TEST(ConfigParse, RejectsMalformedYaml) {
    auto r = Config::parse("remote: [unclosed\n", "broken.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("broken.yaml"), std::string::npos);
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "aspect_reauth_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigFileTest, MissingFileIsEmptyConfig) {
    auto r = Config::load(test_dir / "nope.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.remote().has_value());
}

TEST_F(ConfigFileTest, LoadsFromDisk) {
    fs::path p = test_dir / "config.yaml";
    std::ofstream(p) << "host: lab-box\nssh:\n  args: [\"-v\"]\n";

    auto r = Config::load(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.host(), std::optional<std::string>("lab-box"));
    EXPECT_EQ(r.value.ssh_args(), (std::vector<std::string>{"-v"}));
}

TEST_F(ConfigFileTest, MalformedFileNamesPath) {
    fs::path p = test_dir / "config.yaml";
    std::ofstream(p) << "remote: [oops\n";

    auto r = Config::load(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find(p.string()), std::string::npos);
}
