#ifndef HARMONIA_TYPES_OUTGOING_MESSAGE_HPP
#define HARMONIA_TYPES_OUTGOING_MESSAGE_HPP

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <harmonia/types/enums.hpp>
#include <harmonia/types/file.hpp>
#include <harmonia/types/snowflake.hpp>

/**
 * \file outgoing_message.hpp
 *
 * Defines \ref Harmonia::OutgoingMessage, payload of message create/edit,
 * webhook execute, interaction responses and followups.
 */

namespace Harmonia {
    /**
     * Which mentions in content actually ping.
     *
     * Default-constructed object allows nothing to ping.
     */
    struct AllowedMentions {
        bool users    = false;  ///< Ping all mentioned users.
        bool roles    = false;  ///< Ping all mentioned roles.
        bool everyone = false;  ///< Ping @everyone and @here.
        bool repliedUser = false;

        std::vector<Snowflake> userIds; ///< Ping only these users (ignored if users = true).
        std::vector<Snowflake> roleIds; ///< Ping only these roles (ignored if roles = true).

        static AllowedMentions all() {
            AllowedMentions result;
            result.users = result.roles = result.everyone = result.repliedUser = true;
            return result;
        }

        nlohmann::json toJson() const;
    };

    /**
     * Message to be sent or edited.
     *
     * Set only fields you need, unset fields are not sent (and so
     * not changed on edit).
     */
    struct OutgoingMessage {
        OutgoingMessage() = default;
        OutgoingMessage(const std::string& content) : content(content) {}

        boost::optional<std::string> content;

        /// Embed objects, max 10.
        std::vector<nlohmann::json> embeds;

        bool tts = false;

        /// Message to reply to.
        boost::optional<Snowflake> replyTo;

        /// Fail if \ref replyTo message doesn't exist, otherwise message is sent as regular one.
        bool failIfReplyMissing = true;

        boost::optional<AllowedMentions> allowedMentions;

        /// Action rows, see components.hpp.
        std::vector<nlohmann::json> components;

        /// Guild stickers to attach, max 3.
        std::vector<Snowflake> stickerIds;

        /// Files to upload, max 10. If not empty, request is sent as multipart.
        std::vector<File> files;

        /// Only SuppressEmbeds, SuppressNotifications and (for interactions) Ephemeral can be set.
        MessageFlags flags;

        /// On edit, existing attachments to keep. Attachments not listed are removed.
        boost::optional<std::vector<Snowflake> > keepAttachments;

        /**
         * Check message against API limits.
         *
         * \param editing If true, empty message is allowed (nothing is changed).
         *
         * \throws InvalidParameter on violation.
         */
        void validate(bool editing = false) const;

        /**
         * JSON payload. When files are present, contains "attachments" array
         * with id i for file sent as files[i].
         */
        nlohmann::json toJson() const;
    };
} // namespace Harmonia

#endif // HARMONIA_TYPES_OUTGOING_MESSAGE_HPP
