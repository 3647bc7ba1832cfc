#include <harmonia/types/outgoing_message.hpp>
#include <harmonia/exceptions.hpp>
#include <harmonia/internal/utils.hpp>

namespace Harmonia {
    nlohmann::json AllowedMentions::toJson() const {
        nlohmann::json parse = nlohmann::json::array();
        if (users)    parse.push_back("users");
        if (roles)    parse.push_back("roles");
        if (everyone) parse.push_back("everyone");

        nlohmann::json result = {{ "parse", parse }};
        if (!users && !userIds.empty()) result["users"] = userIds;
        if (!roles && !roleIds.empty()) result["roles"] = roleIds;
        if (repliedUser)                result["replied_user"] = true;
        return result;
    }

    void OutgoingMessage::validate(bool editing) const {
        if (content && Utils::utf8Length(*content) > 2000) {
            throw InvalidParameter("content", "content size out of range (should be 0-2000).");
        }
        if (embeds.size() > 10) {
            throw InvalidParameter("embeds", "too many embeds (should be 0-10).");
        }
        if (stickerIds.size() > 3) {
            throw InvalidParameter("stickerIds", "too many stickers (should be 0-3).");
        }
        if (files.size() > 10) {
            throw InvalidParameter("files", "too many files (should be 0-10).");
        }
        if (components.size() > 5) {
            throw InvalidParameter("components", "too many action rows (should be 0-5).");
        }

        if (editing) return;

        bool hasAttachments = !embeds.empty() || !stickerIds.empty() || !files.empty();
        if (!hasAttachments) {
            if (!content) {
                throw InvalidParameter("content", "You must specify message content, embed, sticker or file.");
            }
            if (content->empty()) {
                throw InvalidParameter("content", "Message content must not be empty.");
            }
        }
    }

    nlohmann::json OutgoingMessage::toJson() const {
        nlohmann::json payload = nlohmann::json::object();

        if (content)             payload["content"]     = *content;
        if (!embeds.empty())     payload["embeds"]      = embeds;
        if (tts)                 payload["tts"]         = true;
        if (!components.empty()) payload["components"]  = components;
        if (!stickerIds.empty()) payload["sticker_ids"] = stickerIds;
        if (uint32_t(flags))     payload["flags"]       = uint32_t(flags);
        if (allowedMentions)     payload["allowed_mentions"] = allowedMentions->toJson();

        if (replyTo) {
            payload["message_reference"] = {
                { "message_id",         *replyTo           },
                { "fail_if_not_exists", failIfReplyMissing }
            };
        }

        if (keepAttachments || !files.empty()) {
            nlohmann::json attachments = nlohmann::json::array();
            if (keepAttachments) {
                for (Snowflake id : *keepAttachments) {
                    attachments.push_back({{ "id", id }});
                }
            }
            for (size_t i = 0; i < files.size(); ++i) {
                attachments.push_back({
                    { "id",       i                 },
                    { "filename", files[i].filename }
                });
            }
            payload["attachments"] = attachments;
        }

        return payload;
    }
} // namespace Harmonia
