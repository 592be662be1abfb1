#include "inbound_file.hpp"
#include <algorithm>
#include <utility>

namespace {

std::optional<std::string> optionalString(const Json::Value& object, const char* key) {
    if (!object.isMember(key) || !object[key].isString() || object[key].asString().empty()) {
        return std::nullopt;
    }
    return object[key].asString();
}

InboundFile fromMedia(MediaKind kind, const Json::Value& media) {
    InboundFile file;
    file.kind = kind;
    file.fileId = media.get("file_id", "").asString();
    file.fileUniqueId = media.get("file_unique_id", "").asString();
    file.fileName = optionalString(media, "file_name");
    if (kind == MediaKind::Sticker) {
        file.animated = media.get("is_animated", false).asBool();
        file.video = media.get("is_video", false).asBool();
    }
    return file;
}

} // namespace

const char* toString(MediaKind kind) {
    switch (kind) {
    case MediaKind::Document: return "document";
    case MediaKind::Photo: return "photo";
    case MediaKind::Video: return "video";
    case MediaKind::Audio: return "audio";
    case MediaKind::Voice: return "voice";
    case MediaKind::Sticker: return "sticker";
    case MediaKind::Animation: return "animation";
    case MediaKind::VideoNote: return "video_note";
    }
    return "file";
}

std::string InboundFile::suggestedName() const {
    std::string prefix = std::string(toString(kind)) + "_" + fileUniqueId;
    std::string name;

    switch (kind) {
    case MediaKind::Document:
        name = fileName.value_or(prefix);
        break;
    case MediaKind::Photo:
        name = prefix + ".jpg";
        break;
    case MediaKind::Video:
        name = fileName.value_or(prefix + ".mp4");
        break;
    case MediaKind::Audio:
        name = fileName.value_or(prefix + ".mp3");
        break;
    case MediaKind::Voice:
        name = prefix + ".ogg";
        break;
    case MediaKind::Sticker:
        name = prefix + (animated ? ".tgs" : video ? ".webm" : ".webp");
        break;
    case MediaKind::Animation:
        name = fileName.value_or(prefix + ".gif");
        break;
    case MediaKind::VideoNote:
        name = prefix + ".mp4";
        break;
    }

    std::replace(name.begin(), name.end(), '/', '_');
    std::replace(name.begin(), name.end(), '\\', '_');
    return name;
}

std::optional<InboundFile> extractInboundFile(const Json::Value& message) {
    if (!message.isObject()) {
        return std::nullopt;
    }
    if (message["document"].isObject()) {
        return fromMedia(MediaKind::Document, message["document"]);
    }
    const Json::Value& photos = message["photo"];
    if (photos.isArray() && !photos.empty()) {
        return fromMedia(MediaKind::Photo, photos[photos.size() - 1]);
    }

    static const std::pair<const char*, MediaKind> kOrder[] = {
        {"video", MediaKind::Video},
        {"audio", MediaKind::Audio},
        {"voice", MediaKind::Voice},
        {"sticker", MediaKind::Sticker},
        {"animation", MediaKind::Animation},
        {"video_note", MediaKind::VideoNote},
    };
    for (const auto& [key, kind] : kOrder) {
        if (message[key].isObject()) {
            return fromMedia(kind, message[key]);
        }
    }
    return std::nullopt;
}
