#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include "relay_config.hpp"

namespace fs = std::filesystem;

namespace {

RelayConfig::EnvLookup environment(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

Json::Value parse(const std::string& text) {
    Json::Value value;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    EXPECT_TRUE(Json::parseFromStream(builder, stream, &value, &errors)) << errors;
    return value;
}

const char* kFullConfig = R"({
    "smb": {
        "username": "backup",
        "password": "secret",
        "server": "192.168.1.10",
        "server_name": "NAS",
        "share": "files",
        "port": 1445,
        "backup_directory": "/telegram",
        "client_name": "RelayTest",
        "probe_failure": "abort",
        "timeout_seconds": 20
    },
    "telegram": { "bot_token": "123:abc", "authorized_user_id": 42, "poll_timeout": 10 },
    "log_dir": "/tmp/smbrelay-logs"
})";

} // namespace

TEST(ShareConfigTest, DefaultsPortAndDirectory) {
    ShareConfig share("u", "p", "host", "files");
    EXPECT_EQ(share.port(), 445);
    EXPECT_EQ(share.backupDirectory(), "/");
    EXPECT_EQ(share.serverName(), "");
    EXPECT_EQ(share.clientName(), "SmbRelayBot");
    EXPECT_EQ(share.probeFailurePolicy(), ProbeFailurePolicy::AssumeAbsent);
    EXPECT_EQ(share.timeoutSeconds(), 0);
}

TEST(ShareConfigTest, MissingSettingsAreNamedTogether) {
    try {
        ShareConfig share("", "p", "host", "");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_STREQ(e.what(), "Missing required SMB settings: SMB_USERNAME, SMB_SHARE");
    }
}

TEST(ShareConfigTest, RejectsBadPortAndClientName) {
    EXPECT_THROW(ShareConfig("u", "p", "host", "files", 0), ConfigurationError);
    EXPECT_THROW(ShareConfig("u", "p", "host", "files", 70000), ConfigurationError);
    ShareConfig share("u", "p", "host", "files");
    EXPECT_THROW(share.withClientName(""), ConfigurationError);
    EXPECT_THROW(share.withTimeoutSeconds(-1), ConfigurationError);
}

TEST(RelayConfigTest, LoadsEveryField) {
    RelayConfig config(parse(kFullConfig), environment({}));

    EXPECT_EQ(config.share.username(), "backup");
    EXPECT_EQ(config.share.password(), "secret");
    EXPECT_EQ(config.share.server(), "192.168.1.10");
    EXPECT_EQ(config.share.serverName(), "NAS");
    EXPECT_EQ(config.share.share(), "files");
    EXPECT_EQ(config.share.port(), 1445);
    EXPECT_EQ(config.share.backupDirectory(), "/telegram");
    EXPECT_EQ(config.share.clientName(), "RelayTest");
    EXPECT_EQ(config.share.probeFailurePolicy(), ProbeFailurePolicy::Abort);
    EXPECT_EQ(config.share.timeoutSeconds(), 20);
    EXPECT_EQ(config.telegram.botToken, "123:abc");
    EXPECT_EQ(config.telegram.authorizedUserId, 42);
    EXPECT_EQ(config.telegram.pollTimeout, 10);
    EXPECT_EQ(config.logFile, "/tmp/smbrelay-logs/relay.log");
    EXPECT_EQ(config.errorLogFile, "/tmp/smbrelay-logs/errors.log");
}

TEST(RelayConfigTest, EnvironmentOverridesFile) {
    RelayConfig config(parse(kFullConfig), environment({{"SMB_PASSWORD", "from-env"},
                                                        {"SMB_PORT", "445"},
                                                        {"BACKUP_DIRECTORY", "/other"},
                                                        {"AUTHORIZED_USER_ID", "7"}}));

    EXPECT_EQ(config.share.password(), "from-env");
    EXPECT_EQ(config.share.port(), 445);
    EXPECT_EQ(config.share.backupDirectory(), "/other");
    EXPECT_EQ(config.telegram.authorizedUserId, 7);
    EXPECT_EQ(config.share.username(), "backup");
}

TEST(RelayConfigTest, EnvironmentAloneIsEnough) {
    RelayConfig config(Json::Value(), environment({{"SMB_USERNAME", "u"},
                                                   {"SMB_PASSWORD", "p"},
                                                   {"SMB_SERVER", "nas"},
                                                   {"SMB_SHARE", "files"},
                                                   {"TELEGRAM_BOT_TOKEN", "t"}}));

    EXPECT_EQ(config.share.port(), 445);
    EXPECT_EQ(config.share.backupDirectory(), "/");
    EXPECT_EQ(config.telegram.authorizedUserId, 0);
    EXPECT_EQ(config.logFile, "./logs/relay.log");
}

TEST(RelayConfigTest, MissingMandatorySettingsAreFatal) {
    EXPECT_THROW(RelayConfig(Json::Value(), environment({{"SMB_USERNAME", "u"}})), ConfigurationError);
}

TEST(RelayConfigTest, MalformedValuesAreFatal) {
    auto base = environment({{"SMB_USERNAME", "u"}, {"SMB_PASSWORD", "p"}, {"SMB_SERVER", "nas"},
                             {"SMB_SHARE", "files"}, {"SMB_PORT", "44x"}});
    EXPECT_THROW(RelayConfig(Json::Value(), base), ConfigurationError);

    EXPECT_THROW(RelayConfig(parse(R"({"smb": {"username": "u", "password": "p", "server": "s",
                                        "share": "f", "probe_failure": "sometimes"}})"),
                             environment({})),
                 ConfigurationError);

    EXPECT_THROW(RelayConfig(parse(kFullConfig), environment({{"AUTHORIZED_USER_ID", "me"}})), ConfigurationError);
}

TEST(RelayConfigTest, WrongJsonTypesAreConfigurationErrors) {
    const std::string credentials = R"("username": "u", "password": "p", "server": "s", "share": "f")";
    auto smbWith = [&](const std::string& extra) {
        return parse("{\"smb\": {" + credentials + ", " + extra + "}}");
    };

    EXPECT_THROW(RelayConfig(smbWith(R"("port": 99999999999)"), environment({})), ConfigurationError);
    EXPECT_THROW(RelayConfig(smbWith(R"("timeout_seconds": 99999999999)"), environment({})), ConfigurationError);
    EXPECT_THROW(RelayConfig(smbWith(R"("timeout_seconds": "soon")"), environment({})), ConfigurationError);
    EXPECT_THROW(RelayConfig(smbWith(R"("client_name": {"name": "bot"})"), environment({})), ConfigurationError);
    EXPECT_THROW(RelayConfig(smbWith(R"("probe_failure": ["abort"])"), environment({})), ConfigurationError);
    EXPECT_THROW(RelayConfig(smbWith(R"("backup_directory": [])"), environment({})), ConfigurationError);

    auto telegramWith = [&](const std::string& telegram) {
        return parse("{\"smb\": {" + credentials + "}, \"telegram\": {" + telegram + "}}");
    };
    EXPECT_THROW(RelayConfig(telegramWith(R"("poll_timeout": "abc")"), environment({})), ConfigurationError);
    EXPECT_THROW(RelayConfig(telegramWith(R"("poll_timeout": 99999999999)"), environment({})), ConfigurationError);
    EXPECT_THROW(RelayConfig(telegramWith(R"("authorized_user_id": 18446744073709551615)"), environment({})),
                 ConfigurationError);
    EXPECT_THROW(RelayConfig(telegramWith(R"("bot_token": {"value": "x"})"), environment({})), ConfigurationError);

    RelayConfig config(telegramWith(R"("poll_timeout": 5)"), environment({}));
    EXPECT_EQ(config.telegram.pollTimeout, 5);
}

TEST(RelayConfigTest, FileErrorsAreConfigurationErrors) {
    EXPECT_THROW(RelayConfig("/nonexistent/relay_config.json"), ConfigurationError);

    fs::path broken = fs::temp_directory_path() / "smbrelay-broken-config.json";
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    EXPECT_THROW(RelayConfig(broken.string()), ConfigurationError);
    fs::remove(broken);
}

TEST(RelayConfigTest, ParsesProbeFailurePolicyNames) {
    EXPECT_EQ(parseProbeFailurePolicy("assume_absent"), ProbeFailurePolicy::AssumeAbsent);
    EXPECT_EQ(parseProbeFailurePolicy("abort"), ProbeFailurePolicy::Abort);
    EXPECT_THROW(parseProbeFailurePolicy("retry"), ConfigurationError);
}
