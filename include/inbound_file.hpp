/**
 * @file inbound_file.hpp
 * @brief Chat media model for SmbRelay.
 *
 * Normalizes the different kinds of Telegram media (documents, photos, stickers, ...) into one
 * tagged type carrying what the relay needs: the file id to download and a filename to store it
 * under.
 */

#ifndef INBOUND_FILE_HPP
#define INBOUND_FILE_HPP

#include <optional>
#include <string>
#include <json/json.h>

/**
 * @brief Kind of media attached to a chat message.
 */
enum class MediaKind {
    Document,
    Photo,
    Video,
    Audio,
    Voice,
    Sticker,
    Animation,
    VideoNote
};

/**
 * @brief Returns the lowercase name of a media kind ("document", "video_note", ...).
 */
const char* toString(MediaKind kind);

/**
 * @brief A file received through the chat, independent of the messaging SDK's object model.
 */
struct InboundFile {
    MediaKind kind = MediaKind::Document;
    std::string fileId;                  ///< Id used to download the file.
    std::string fileUniqueId;            ///< Stable id, used to name files that carry no name.
    std::optional<std::string> fileName; ///< Name supplied by the sender, if any.
    bool animated = false;               ///< Sticker is an animated (.tgs) sticker.
    bool video = false;                  ///< Sticker is a video (.webm) sticker.

    /**
     * @brief Returns the filename the file should be stored under.
     *
     * Uses the sender's name where the media kind carries one, otherwise
     * "<kind>_<unique id>.<default extension>". Path separators are replaced by '_'.
     */
    std::string suggestedName() const;
};

/**
 * @brief Extracts the first supported media from a Telegram message object.
 *
 * Media are checked in the order document, photo, video, audio, voice, sticker, animation,
 * video note. For photos the last (largest) size is used.
 *
 * @param message Telegram "message" object.
 * @return std::optional<InboundFile> The media, or std::nullopt when the message carries none.
 */
std::optional<InboundFile> extractInboundFile(const Json::Value& message);

#endif // INBOUND_FILE_HPP
