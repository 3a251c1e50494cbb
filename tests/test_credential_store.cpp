#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "core/auth/CredentialDocument.hpp"
#include "core/auth/CredentialLocator.hpp"
#include "core/auth/CredentialStore.hpp"
#include "core/auth/WindowsCredentialBackend.hpp"
#include "utils/HashUtils.hpp"
#include "utils/StringUtils.hpp"

#include <fstream>
#include <sstream>

using namespace keyrotor::core::auth;
using keyrotor::testing::FakeClock;
using keyrotor::testing::FakeProcessRunner;
using keyrotor::utils::OS;
using keyrotor::utils::ProcessRequest;
using keyrotor::utils::StringUtils;

namespace fs = std::filesystem;

namespace {

std::string credentialJson(const std::string& token, const std::string& email = "dev@example.com") {
    return R"({"claudeAiOauth": {"accessToken": ")" + token +
           R"(", "refreshToken": "sk-ant-ort01-refresh", "expiresAt": 1900000000000, "email": ")" +
           email + R"(", "subscriptionType": "max"}})";
}

ExecutableResolver resolverFor(std::vector<std::string> available) {
    return [available](const std::string& tool) -> std::optional<fs::path> {
        for (const auto& name : available) {
            if (name == tool) return fs::path("/usr/bin") / tool;
        }
        return std::nullopt;
    };
}

std::string readAll(const fs::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

class CredentialStoreTest : public keyrotor::testing::TempDirTest {
protected:
    FakeClock clock;
    FakeProcessRunner runner;

    std::string configDir() const { return test_dir.string(); }
    fs::path credentialsFile() const { return test_dir / ".credentials.json"; }

    void writeCredentialsFile(const std::string& content) {
        std::ofstream(credentialsFile()) << content;
    }

    std::unique_ptr<CredentialStore> makeStore(OS os, std::vector<std::string> tools = {}) {
        return std::make_unique<CredentialStore>(runner, clock, CredentialStoreOptions{}, os,
                                                 resolverFor(std::move(tools)));
    }
};

// -- Linux / file --

TEST_F(CredentialStoreTest, CachedReadIsIdempotentUntilTtl) {
    writeCredentialsFile(credentialJson("sk-ant-first"));
    auto store = makeStore(OS::Linux);

    auto first = store->getCredentials(configDir());
    ASSERT_TRUE(first.hasToken());
    EXPECT_EQ(*first.token, "sk-ant-first");
    EXPECT_EQ(first.email.value_or(""), "dev@example.com");

    writeCredentialsFile(credentialJson("sk-ant-second"));
    clock.advance(std::chrono::seconds(299));
    EXPECT_EQ(*store->getCredentials(configDir()).token, "sk-ant-first");

    clock.advance(std::chrono::seconds(2));
    EXPECT_EQ(*store->getCredentials(configDir()).token, "sk-ant-second");
}

TEST_F(CredentialStoreTest, ForceRefreshBypassesCache) {
    writeCredentialsFile(credentialJson("sk-ant-first"));
    auto store = makeStore(OS::Linux);

    store->getCredentials(configDir());
    writeCredentialsFile(credentialJson("sk-ant-second"));

    EXPECT_EQ(*store->getCredentials(configDir(), true).token, "sk-ant-second");

    writeCredentialsFile(credentialJson("sk-ant-third"));
    store->clearCache(configDir());
    EXPECT_EQ(*store->getCredentials(configDir()).token, "sk-ant-third");
}

TEST_F(CredentialStoreTest, MissingEverywhereIsNotFound) {
    auto store = makeStore(OS::Linux);

    auto creds = store->getFullCredentials(configDir());
    EXPECT_FALSE(creds.hasToken());
    EXPECT_FALSE(creds.hasError());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::NotFound);
}

TEST_F(CredentialStoreTest, MalformedFileReadsAsEmpty) {
    writeCredentialsFile("{\"claudeAiOauth\": ");
    auto store = makeStore(OS::Linux);

    auto creds = store->getFullCredentials(configDir());
    EXPECT_FALSE(creds.hasToken());
    EXPECT_FALSE(creds.hasError());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::MalformedData);
}

TEST_F(CredentialStoreTest, ErrorResultsUseShortTtl) {
    runner.handler = [](const ProcessRequest&) {
        return FakeProcessRunner::exitWith(1, "", "Cannot unlock collection");
    };
    auto store = makeStore(OS::Linux, {"secret-tool"});

    auto creds = store->getFullCredentials(configDir());
    EXPECT_TRUE(creds.hasError());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::AccessDenied);
    EXPECT_EQ(runner.requests.size(), 1u);

    clock.advance(std::chrono::seconds(9));
    store->getFullCredentials(configDir());
    EXPECT_EQ(runner.requests.size(), 1u);

    clock.advance(std::chrono::seconds(2));
    store->getFullCredentials(configDir());
    EXPECT_EQ(runner.requests.size(), 2u);
}

TEST_F(CredentialStoreTest, SecretServiceTokenWinsOverFile) {
    writeCredentialsFile(credentialJson("sk-ant-from-file"));
    runner.handler = [](const ProcessRequest&) {
        return FakeProcessRunner::exitWith(0, credentialJson("sk-ant-from-keyring") + "\n");
    };
    auto store = makeStore(OS::Linux, {"secret-tool"});

    auto creds = store->getCredentials(configDir());
    EXPECT_EQ(creds.token.value_or(""), "sk-ant-from-keyring");

    ASSERT_EQ(runner.requests.size(), 1u);
    const auto& request = runner.requests.front();
    EXPECT_EQ(request.program, "/usr/bin/secret-tool");
    std::vector<std::string> expected{"lookup", "application",
                                      CredentialLocator::secretServiceAttribute(configDir())};
    EXPECT_EQ(request.args, expected);
}

TEST_F(CredentialStoreTest, FileUsedWhenKeyringHasNoMatch) {
    writeCredentialsFile(credentialJson("sk-ant-from-file"));
    runner.handler = [](const ProcessRequest&) { return FakeProcessRunner::exitWith(1); };
    auto store = makeStore(OS::Linux, {"secret-tool"});

    EXPECT_EQ(store->getCredentials(configDir()).token.value_or(""), "sk-ant-from-file");
}

TEST_F(CredentialStoreTest, UpdateRoundTripPreservesIdentity) {
    writeCredentialsFile(credentialJson("sk-ant-old"));
    auto store = makeStore(OS::Linux);

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;

    auto result = store->updateCredentials(configDir(), update);
    ASSERT_TRUE(result.success) << result.error.value_or("");

    auto creds = store->getFullCredentials(configDir());
    EXPECT_EQ(creds.token.value_or(""), "sk-ant-new");
    EXPECT_EQ(creds.refreshToken.value_or(""), "sk-ant-ort01-new");
    EXPECT_EQ(creds.expiresAt.value_or(0), 1950000000000);
    EXPECT_EQ(creds.email.value_or(""), "dev@example.com");
    EXPECT_EQ(creds.subscriptionType.value_or(""), "max");

#ifndef _WIN32
    auto perms = fs::status(credentialsFile()).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
#endif
    EXPECT_FALSE(fs::exists(test_dir / ".credentials.json.tmp"));
}

TEST_F(CredentialStoreTest, UpdateDropsStaleCacheEntry) {
    writeCredentialsFile(credentialJson("sk-ant-old"));
    auto store = makeStore(OS::Linux);
    store->getCredentials(configDir());

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;
    ASSERT_TRUE(store->updateCredentials(configDir(), update).success);

    EXPECT_EQ(store->getCredentials(configDir()).token.value_or(""), "sk-ant-new");
}

TEST_F(CredentialStoreTest, UpdateRejectsEmptyAccessToken) {
    auto store = makeStore(OS::Linux);

    TokenUpdate update;
    update.refreshToken = "sk-ant-ort01-new";
    auto result = store->updateCredentials(configDir(), update);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, CredentialErrorKind::MalformedData);
    EXPECT_FALSE(fs::exists(credentialsFile()));
}

TEST_F(CredentialStoreTest, UpdateReportsPersistenceFailure) {
    // A directory in the way of the temporary file makes the write fail
    fs::create_directories(test_dir / ".credentials.json.tmp");
    auto store = makeStore(OS::Linux);

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;
    auto result = store->updateCredentials(configDir(), update);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, CredentialErrorKind::PersistenceFailure);
    EXPECT_TRUE(result.error.has_value());
}

TEST_F(CredentialStoreTest, SecretServiceWritePassesDocumentOnStdin) {
    runner.handler = [](const ProcessRequest& request) {
        if (request.args.front() == "store") return FakeProcessRunner::exitWith(0);
        return FakeProcessRunner::exitWith(1);
    };
    auto store = makeStore(OS::Linux, {"secret-tool"});

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;
    ASSERT_TRUE(store->updateCredentials(configDir(), update).success);

    const auto& request = runner.requests.back();
    std::vector<std::string> expected{
        "store",
        "--label=" + CredentialLocator::keychainServiceName(configDir()),
        "application",
        CredentialLocator::secretServiceAttribute(configDir())};
    EXPECT_EQ(request.args, expected);
    EXPECT_TRUE(StringUtils::contains(request.stdinData, "sk-ant-new"));
    for (const auto& arg : request.args) {
        EXPECT_FALSE(StringUtils::contains(arg, "sk-ant-new"));
    }
    EXPECT_FALSE(fs::exists(credentialsFile()));
}

TEST_F(CredentialStoreTest, SecretServiceWriteFailureFallsBackToFile) {
    runner.handler = [](const ProcessRequest& request) {
        if (request.args.front() == "store") return FakeProcessRunner::exitWith(1, "", "no keyring daemon");
        return FakeProcessRunner::exitWith(1);
    };
    auto store = makeStore(OS::Linux, {"secret-tool"});

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;
    ASSERT_TRUE(store->updateCredentials(configDir(), update).success);

    ASSERT_TRUE(fs::exists(credentialsFile()));
    EXPECT_TRUE(StringUtils::contains(readAll(credentialsFile()), "sk-ant-new"));
}

TEST_F(CredentialStoreTest, UnknownPlatformUsesFileOnly) {
    writeCredentialsFile(credentialJson("sk-ant-file"));
    auto store = makeStore(OS::Unknown, {"secret-tool", "security", "powershell"});

    EXPECT_EQ(store->getCredentials(configDir()).token.value_or(""), "sk-ant-file");
    EXPECT_TRUE(runner.requests.empty());
}

TEST_F(CredentialStoreTest, CacheKeysPerPlatform) {
    std::string service = CredentialLocator::keychainServiceName(configDir());

    EXPECT_EQ(makeStore(OS::macOS)->cacheKey(configDir()), "macos:" + service);
    EXPECT_EQ(makeStore(OS::Windows)->cacheKey(configDir()), "windows:" + service);
    EXPECT_EQ(makeStore(OS::Linux)->cacheKey(configDir()), "linux:" + credentialsFile().string());
}

// -- macOS --

TEST_F(CredentialStoreTest, KeychainLookupArguments) {
    runner.handler = [](const ProcessRequest&) {
        return FakeProcessRunner::exitWith(0, credentialJson("sk-ant-keychain") + "\n");
    };
    auto store = makeStore(OS::macOS, {"security"});

    auto creds = store->getFullCredentials(configDir());
    EXPECT_EQ(creds.token.value_or(""), "sk-ant-keychain");

    ASSERT_EQ(runner.requests.size(), 1u);
    const auto& request = runner.requests.front();
    EXPECT_EQ(request.program, "/usr/bin/security");
    std::vector<std::string> expected{"find-generic-password", "-s",
                                      CredentialLocator::keychainServiceName(configDir()), "-w"};
    EXPECT_EQ(request.args, expected);
    EXPECT_EQ(request.timeout, std::chrono::milliseconds(5000));
}

TEST_F(CredentialStoreTest, KeychainExitCodes) {
    int exitCode = 44;
    runner.handler = [&exitCode](const ProcessRequest&) {
        return FakeProcessRunner::exitWith(exitCode, "", "security: SecKeychainSearchCopyNext failed");
    };
    auto store = makeStore(OS::macOS, {"security"});

    auto notFound = store->getFullCredentials(configDir(), true);
    EXPECT_FALSE(notFound.hasToken());
    EXPECT_FALSE(notFound.hasError());
    EXPECT_EQ(notFound.errorKind, CredentialErrorKind::NotFound);

    exitCode = 36;
    auto denied = store->getFullCredentials(configDir(), true);
    EXPECT_FALSE(denied.hasToken());
    EXPECT_TRUE(denied.hasError());
    EXPECT_EQ(denied.errorKind, CredentialErrorKind::AccessDenied);
}

TEST_F(CredentialStoreTest, KeychainTimeoutIsAccessDenied) {
    runner.handler = [](const ProcessRequest&) { return FakeProcessRunner::timedOut(); };
    auto store = makeStore(OS::macOS, {"security"});

    auto creds = store->getFullCredentials(configDir());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::AccessDenied);
    EXPECT_EQ(creds.error.value_or(""), "Keychain access timed out");
}

TEST_F(CredentialStoreTest, MissingSecurityToolIsNotAnError) {
    auto store = makeStore(OS::macOS);

    auto creds = store->getFullCredentials(configDir());
    EXPECT_FALSE(creds.hasToken());
    EXPECT_FALSE(creds.hasError());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::ToolMissing);
    EXPECT_TRUE(runner.requests.empty());
}

TEST_F(CredentialStoreTest, KeychainWriteDeletesThenAdds) {
    runner.handler = [](const ProcessRequest& request) {
        if (request.args.front() == "find-generic-password") {
            return FakeProcessRunner::exitWith(0, credentialJson("sk-ant-old"));
        }
        if (request.args.front() == "delete-generic-password") {
            return FakeProcessRunner::exitWith(44);
        }
        return FakeProcessRunner::exitWith(0);
    };
    auto store = makeStore(OS::macOS, {"security"});

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;
    ASSERT_TRUE(store->updateCredentials(configDir(), update).success);

    ASSERT_EQ(runner.requests.size(), 3u);
    std::string service = CredentialLocator::keychainServiceName(configDir());
    EXPECT_EQ(runner.requests[1].args, (std::vector<std::string>{"delete-generic-password", "-s", service}));

    const auto& add = runner.requests[2].args;
    ASSERT_EQ(add.size(), 7u);
    EXPECT_EQ(add[0], "add-generic-password");
    EXPECT_EQ(add[2], service);
    EXPECT_EQ(add[5], "-w");

    auto stored = parseCredentialText(add[6], "test");
    EXPECT_EQ(stored.token.value_or(""), "sk-ant-new");
    EXPECT_EQ(stored.email.value_or(""), "dev@example.com");
}

TEST_F(CredentialStoreTest, KeychainWriteFailureIsAccessDenied) {
    runner.handler = [](const ProcessRequest& request) {
        if (request.args.front() == "add-generic-password") {
            return FakeProcessRunner::exitWith(45, "", "User interaction is not allowed.");
        }
        return FakeProcessRunner::exitWith(44);
    };
    auto store = makeStore(OS::macOS, {"security"});

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    auto result = store->updateCredentials(configDir(), update);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, CredentialErrorKind::AccessDenied);
}

// -- Windows --

TEST_F(CredentialStoreTest, WindowsPrefersFileOverCredentialManager) {
    writeCredentialsFile(credentialJson("sk-ant-file-token"));
    runner.handler = [](const ProcessRequest&) {
        return FakeProcessRunner::exitWith(0, credentialJson("sk-ant-credman-token") + "\r\n");
    };
    auto store = makeStore(OS::Windows, {"powershell"});

    EXPECT_EQ(store->getCredentials(configDir()).token.value_or(""), "sk-ant-file-token");
}

TEST_F(CredentialStoreTest, WindowsFallsBackToCredentialManager) {
    runner.handler = [](const ProcessRequest&) {
        return FakeProcessRunner::exitWith(0, credentialJson("sk-ant-credman-token") + "\r\n");
    };
    auto store = makeStore(OS::Windows, {"powershell"});

    EXPECT_EQ(store->getCredentials(configDir()).token.value_or(""), "sk-ant-credman-token");

    ASSERT_EQ(runner.requests.size(), 1u);
    const auto& args = runner.requests.front().args;
    ASSERT_EQ(args.size(), 6u);
    EXPECT_EQ(args[0], "-NoProfile");
    EXPECT_EQ(args[4], "-Command");
    EXPECT_TRUE(StringUtils::contains(args[5], CredentialLocator::keychainServiceName(configDir())));
    EXPECT_EQ(runner.requests.front().timeout, std::chrono::milliseconds(10000));
}

TEST_F(CredentialStoreTest, WindowsWriteEncodesDocument) {
    runner.handler = [](const ProcessRequest& request) {
        if (StringUtils::contains(request.args.back(), "FromBase64String")) {
            return FakeProcessRunner::exitWith(0, "SUCCESS\r\n");
        }
        return FakeProcessRunner::exitWith(0, "\r\n");
    };
    auto store = makeStore(OS::Windows, {"powershell"});

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;
    ASSERT_TRUE(store->updateCredentials(configDir(), update).success);

    std::string document = serializeCredentialDocument(update, FullOAuthCredentials{}).dump();
    const std::string& script = runner.requests.back().args.back();
    EXPECT_TRUE(StringUtils::contains(script, keyrotor::utils::HashUtils::base64Encode(document)));
    EXPECT_FALSE(StringUtils::contains(script, "sk-ant-new"));

    EXPECT_TRUE(fs::exists(credentialsFile()));
}

TEST_F(CredentialStoreTest, WindowsCredentialManagerFailureKeepsFileWrite) {
    runner.handler = [](const ProcessRequest&) {
        return FakeProcessRunner::exitWith(1, "", "CredWrite failed");
    };
    auto store = makeStore(OS::Windows, {"powershell"});

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-ort01-new";
    update.expiresAt = 1950000000000;
    EXPECT_TRUE(store->updateCredentials(configDir(), update).success);
    EXPECT_EQ(store->getCredentials(configDir()).token.value_or(""), "sk-ant-new");
}

TEST(WindowsScriptTest, TargetIsEscaped) {
    std::string script = WindowsCredentialBackend::buildReadScript("Claude Code-credentials");
    EXPECT_TRUE(StringUtils::contains(script, "CredRead(\"Claude Code-credentials\", 1, 0"));

    std::string write = WindowsCredentialBackend::buildWriteScript("Claude Code-credentials", "e30=");
    EXPECT_TRUE(StringUtils::contains(write, "FromBase64String('e30=')"));
    EXPECT_TRUE(StringUtils::contains(write, "claude-ai-oauth"));
    EXPECT_TRUE(StringUtils::contains(write, "$cred.Persist = 2"));
}

TEST(WindowsScriptTest, PowerShellEscaping) {
    EXPECT_EQ(StringUtils::escapePowerShell("a`b$c\"d"), "a``b`$c`\"d");
    EXPECT_EQ(StringUtils::escapePowerShell("plain"), "plain");
}

TEST(WindowsScriptTest, Base64) {
    EXPECT_EQ(keyrotor::utils::HashUtils::base64Encode("hello"), "aGVsbG8=");
    EXPECT_EQ(keyrotor::utils::HashUtils::base64Encode(""), "");
}
