#include "relay_config.hpp"
#include <cstdlib>
#include <fstream>
#include <utility>
#include <vector>

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

int parsePort(const std::string& text) {
    std::size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid SMB port: " + text);
    }
    if (consumed != text.size()) {
        throw ConfigurationError("Invalid SMB port: " + text);
    }
    return port;
}

std::int64_t parseUserId(const std::string& text) {
    std::size_t consumed = 0;
    std::int64_t id = 0;
    try {
        id = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid AUTHORIZED_USER_ID: " + text);
    }
    if (consumed != text.size()) {
        throw ConfigurationError("Invalid AUTHORIZED_USER_ID: " + text);
    }
    return id;
}

std::string stringMember(const Json::Value& section, const char* key) {
    const Json::Value& value = section[key];
    if (!value.isConvertibleTo(Json::stringValue)) {
        throw ConfigurationError(std::string("Invalid ") + key + " in config file: expected a string");
    }
    return value.asString();
}

int intMember(const Json::Value& section, const char* key) {
    const Json::Value& value = section[key];
    if (!value.isInt()) {
        throw ConfigurationError(std::string("Invalid ") + key + " in config file: expected an integer");
    }
    return value.asInt();
}

// Environment first, then the JSON member, then the fallback.
std::string setting(const RelayConfig::EnvLookup& env, const std::string& envName,
                    const Json::Value& section, const char* key, const std::string& fallback = "") {
    if (auto value = env(envName)) {
        return *value;
    }
    if (section.isObject() && section.isMember(key) && !section[key].isNull()) {
        return stringMember(section, key);
    }
    return fallback;
}

} // namespace

ShareConfig::ShareConfig(std::string username,
                         std::string password,
                         std::string server,
                         std::string share,
                         int port,
                         std::string backupDirectory,
                         std::string serverName)
    : username_(std::move(username)),
      password_(std::move(password)),
      server_(std::move(server)),
      serverName_(std::move(serverName)),
      share_(std::move(share)),
      port_(port),
      backupDirectory_(std::move(backupDirectory)) {
    std::vector<std::string> missing;
    if (username_.empty()) missing.emplace_back("SMB_USERNAME");
    if (password_.empty()) missing.emplace_back("SMB_PASSWORD");
    if (server_.empty()) missing.emplace_back("SMB_SERVER");
    if (share_.empty()) missing.emplace_back("SMB_SHARE");
    if (!missing.empty()) {
        throw ConfigurationError("Missing required SMB settings: " + joinNames(missing));
    }
    if (port_ <= 0 || port_ > 65535) {
        throw ConfigurationError("SMB port out of range: " + std::to_string(port_));
    }
    if (backupDirectory_.empty()) {
        backupDirectory_ = "/";
    }
}

ShareConfig ShareConfig::withClientName(std::string clientName) const {
    if (clientName.empty()) {
        throw ConfigurationError("SMB client name must not be empty");
    }
    ShareConfig copy = *this;
    copy.clientName_ = std::move(clientName);
    return copy;
}

ShareConfig ShareConfig::withProbeFailurePolicy(ProbeFailurePolicy policy) const {
    ShareConfig copy = *this;
    copy.probeFailurePolicy_ = policy;
    return copy;
}

ShareConfig ShareConfig::withTimeoutSeconds(int seconds) const {
    if (seconds < 0) {
        throw ConfigurationError("SMB timeout must not be negative: " + std::to_string(seconds));
    }
    ShareConfig copy = *this;
    copy.timeoutSeconds_ = seconds;
    return copy;
}

ProbeFailurePolicy parseProbeFailurePolicy(const std::string& name) {
    if (name == "assume_absent") {
        return ProbeFailurePolicy::AssumeAbsent;
    }
    if (name == "abort") {
        return ProbeFailurePolicy::Abort;
    }
    throw ConfigurationError("Unknown probe_failure policy: " + name + " (use assume_absent or abort)");
}

RelayConfig::RelayConfig(const std::string& configFile)
    : RelayConfig(loadFile(configFile), &RelayConfig::processEnvironment) {}

RelayConfig::RelayConfig(const Json::Value& configJson, const EnvLookup& env)
    : share(loadShare(configJson.isObject() ? configJson["smb"] : Json::Value(), env)),
      telegram(loadTelegram(configJson.isObject() ? configJson["telegram"] : Json::Value(), env)) {
    logDir = configJson.isObject() && configJson.isMember("log_dir") ? stringMember(configJson, "log_dir") : "./logs/";
    if (logDir.empty()) {
        logDir = "./";
    }
    if (logDir.back() != '/') {
        logDir += '/';
    }
    logFile = logDir + "relay.log";
    errorLogFile = logDir + "errors.log";
}

std::optional<std::string> RelayConfig::processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

Json::Value RelayConfig::loadFile(const std::string& configFile) {
    if (configFile.empty()) {
        return Json::Value();
    }
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open config file: " + configFile);
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw ConfigurationError("Failed to parse config file: " + configFile + " (" + errors + ")");
    }
    if (!configJson.isObject()) {
        throw ConfigurationError("Config file must contain a JSON object: " + configFile);
    }
    return configJson;
}

ShareConfig RelayConfig::loadShare(const Json::Value& smb, const EnvLookup& env) {
    int port = 445;
    if (auto value = env("SMB_PORT")) {
        port = parsePort(*value);
    } else if (smb.isObject() && smb.isMember("port")) {
        const Json::Value& jsonPort = smb["port"];
        if (jsonPort.isIntegral()) {
            port = intMember(smb, "port");
        } else if (jsonPort.isString()) {
            port = parsePort(jsonPort.asString());
        } else {
            throw ConfigurationError("Invalid SMB port in config file");
        }
    }

    ShareConfig share(setting(env, "SMB_USERNAME", smb, "username"),
                      setting(env, "SMB_PASSWORD", smb, "password"),
                      setting(env, "SMB_SERVER", smb, "server"),
                      setting(env, "SMB_SHARE", smb, "share"),
                      port,
                      setting(env, "BACKUP_DIRECTORY", smb, "backup_directory", "/"),
                      setting(env, "SMB_SERVER_NAME", smb, "server_name"));

    if (!smb.isObject()) {
        return share;
    }
    if (smb.isMember("client_name")) {
        share = share.withClientName(stringMember(smb, "client_name"));
    }
    if (smb.isMember("probe_failure")) {
        share = share.withProbeFailurePolicy(parseProbeFailurePolicy(stringMember(smb, "probe_failure")));
    }
    if (smb.isMember("timeout_seconds")) {
        share = share.withTimeoutSeconds(intMember(smb, "timeout_seconds"));
    }
    return share;
}

TelegramConfig RelayConfig::loadTelegram(const Json::Value& telegram, const EnvLookup& env) {
    TelegramConfig config;
    config.botToken = setting(env, "TELEGRAM_BOT_TOKEN", telegram, "bot_token");

    if (auto value = env("AUTHORIZED_USER_ID")) {
        config.authorizedUserId = parseUserId(*value);
    } else if (telegram.isObject() && telegram.isMember("authorized_user_id")) {
        const Json::Value& id = telegram["authorized_user_id"];
        if (id.isInt64()) {
            config.authorizedUserId = id.asInt64();
        } else if (id.isString()) {
            config.authorizedUserId = parseUserId(id.asString());
        } else {
            throw ConfigurationError("Invalid telegram.authorized_user_id in config file");
        }
    }

    if (telegram.isObject() && telegram.isMember("poll_timeout")) {
        config.pollTimeout = intMember(telegram, "poll_timeout");
    }
    if (config.pollTimeout < 0) {
        throw ConfigurationError("telegram.poll_timeout must not be negative");
    }
    return config;
}
