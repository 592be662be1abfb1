#include "telegram_api.hpp"
#include <csignal>
#include <curl/curl.h>
#include <fstream>
#include <memory>
#include <sstream>

extern volatile std::sig_atomic_t gShutdownFlag;

namespace {

// A download slower than this many bytes per second for the whole window is abandoned.
constexpr long kDownloadLowSpeedBytes = 1;
constexpr long kDownloadLowSpeedSeconds = 60;
constexpr long kConnectTimeoutSeconds = 30;

size_t writeToString(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t writeToStream(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::ofstream*>(userp);
    out->write(static_cast<char*>(contents), static_cast<std::streamsize>(size * nmemb));
    return *out ? size * nmemb : 0;
}

int abortOnShutdown(void* /*clientp*/, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return gShutdownFlag ? 1 : 0;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

std::string escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        return "";
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace

std::expected<Json::Value, std::string> parseApiResponse(const std::string& body) {
    Json::Value response;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(body);
    if (!Json::parseFromStream(builder, stream, &response, &errors)) {
        return std::unexpected("Invalid Telegram response: " + errors);
    }
    if (!response.isObject()) {
        return std::unexpected(std::string("Invalid Telegram response: not an object"));
    }
    const Json::Value& ok = response["ok"];
    if (!ok.isBool() || !ok.asBool()) {
        return std::unexpected("Telegram API error: " + response.get("description", "unknown error").asString());
    }
    return response["result"];
}

CurlTelegramApi::CurlTelegramApi(std::string botToken, std::string apiBase)
    : botToken(std::move(botToken)), apiBase(std::move(apiBase)) {}

std::expected<Json::Value, std::string> CurlTelegramApi::call(
    const std::string& method,
    const std::vector<std::pair<std::string, std::string>>& fields,
    long timeoutSeconds) {
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return std::unexpected(std::string("Failed to initialize CURL"));
    }

    std::string postFields;
    for (const auto& [key, value] : fields) {
        if (!postFields.empty()) {
            postFields += '&';
        }
        postFields += key + "=" + escape(curl.get(), value);
    }

    std::string url = apiBase + "/bot" + botToken + "/" + method;
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, postFields.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected("Telegram request " + method + " failed: " + curl_easy_strerror(res));
    }
    return parseApiResponse(body);
}

std::expected<Json::Value, std::string> CurlTelegramApi::getUpdates(std::int64_t offset, int timeoutSeconds) {
    return call("getUpdates",
                {{"offset", std::to_string(offset)},
                 {"timeout", std::to_string(timeoutSeconds)},
                 {"allowed_updates", "[\"message\"]"}},
                timeoutSeconds + 15);
}

std::expected<std::int64_t, std::string> CurlTelegramApi::sendMessage(std::int64_t chatId, const std::string& text) {
    auto result = call("sendMessage", {{"chat_id", std::to_string(chatId)}, {"text", text}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return (*result).get("message_id", 0).asInt64();
}

std::expected<void, std::string> CurlTelegramApi::editMessageText(std::int64_t chatId, std::int64_t messageId,
                                                                  const std::string& text) {
    auto result = call("editMessageText",
                       {{"chat_id", std::to_string(chatId)},
                        {"message_id", std::to_string(messageId)},
                        {"text", text}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::expected<std::string, std::string> CurlTelegramApi::getFilePath(const std::string& fileId) {
    auto result = call("getFile", {{"file_id", fileId}});
    if (!result) {
        return std::unexpected(result.error());
    }
    std::string filePath = (*result).get("file_path", "").asString();
    if (filePath.empty()) {
        return std::unexpected("Telegram returned no file_path for " + fileId);
    }
    return filePath;
}

std::expected<void, std::string> CurlTelegramApi::downloadFile(const std::string& filePath, const std::string& localPath) {
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return std::unexpected(std::string("Failed to initialize CURL"));
    }
    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected("Failed to open " + localPath + " for writing");
    }

    std::string url = apiBase + "/file/bot" + botToken + "/" + filePath;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToStream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, kDownloadLowSpeedBytes);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, kDownloadLowSpeedSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, abortOnShutdown);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected("Failed to download " + filePath + ": " + curl_easy_strerror(res));
    }
    out.close();
    if (!out) {
        return std::unexpected("Failed to write " + localPath);
    }
    return {};
}
