#include <gtest/gtest.h>
#include <core/credentials.hpp>
#include "fakes.hpp"
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

class FileCredentialStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path file;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "aspect_reauth_credentials_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        file = test_dir / "nested" / "credentials";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(FileCredentialStoreTest, MissingEntryIsError) {
    FileCredentialStore store(file);
    auto r = store.get("AspectWorkflows", "remote.example");
    EXPECT_TRUE(r.is_err());
}

TEST_F(FileCredentialStoreTest, SetThenGet) {
    FileCredentialStore store(file);
    ASSERT_TRUE(store.set("AspectWorkflows", "remote.example", "tok=en").is_ok());

    auto r = store.get("AspectWorkflows", "remote.example");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "tok=en");
}

TEST_F(FileCredentialStoreTest, OverwriteKeepsOtherEntries) {
    FileCredentialStore store(file);
    ASSERT_TRUE(store.set("svc", "a", "1").is_ok());
    ASSERT_TRUE(store.set("svc", "b", "2").is_ok());
    ASSERT_TRUE(store.set("svc", "a", "3").is_ok());

    EXPECT_EQ(store.get("svc", "a").value, "3");
    EXPECT_EQ(store.get("svc", "b").value, "2");
}

TEST_F(FileCredentialStoreTest, FileIsOwnerOnly) {
    FileCredentialStore store(file);
    ASSERT_TRUE(store.set("svc", "acct", "secret").is_ok());

    struct stat st;
    ASSERT_EQ(stat(file.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600);
}

TEST_F(FileCredentialStoreTest, RejectsMultilineValue) {
    FileCredentialStore store(file);
    EXPECT_TRUE(store.set("svc", "acct", "line1\nline2").is_err());
    EXPECT_TRUE(store.set("svc", "a=b", "v").is_err());
}

TEST(MakeCredentialStore, Backends) {
    FakeRunner runner;
    auto sys = make_credential_store("system", "/tmp/unused", runner);
    ASSERT_TRUE(sys.is_ok());
    EXPECT_NE(dynamic_cast<SystemCredentialStore*>(sys.value.get()), nullptr);

    auto file = make_credential_store("file", "/tmp/creds", runner);
    ASSERT_TRUE(file.is_ok());
    auto* fs_store = dynamic_cast<FileCredentialStore*>(file.value.get());
    ASSERT_NE(fs_store, nullptr);
    EXPECT_EQ(fs_store->path().string(), "/tmp/creds");

    EXPECT_TRUE(make_credential_store("vault", "", runner).is_err());
}

#ifndef __APPLE__
TEST(SecretToolStore, LookupArguments) {
    FakeRunner runner;
    runner.on([](const ProcessSpec& s) { return s.program == "secret-tool"; },
              succeeded("token-value"));
    SystemCredentialStore store(runner);

    auto r = store.get("AspectWorkflows", "remote.example");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "token-value");

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].args, (std::vector<std::string>{
        "lookup", "service", "AspectWorkflows", "username", "remote.example"}));
}

TEST(SecretToolStore, NoMatchIsError) {
    FakeRunner runner;
    runner.on([](const ProcessSpec& s) { return s.program == "secret-tool"; }, exited(1));
    SystemCredentialStore store(runner);

    EXPECT_TRUE(store.get("AspectWorkflows", "remote.example").is_err());
}

TEST(SecretToolStore, StoreSendsSecretOnStdin) {
    FakeRunner runner;
    SystemCredentialStore store(runner);

    ASSERT_TRUE(store.set("AspectWorkflows", "remote.example", "s3cret").is_ok());

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].args[0], "store");
    EXPECT_EQ(calls[0].input, "s3cret");
    EXPECT_EQ(calls[0].stdin_mode, platform::Stdio::Pipe);
    for (const auto& a : calls[0].args) {
        EXPECT_EQ(a.find("s3cret"), std::string::npos);
    }
}
#endif
