#ifndef HARMONIA_PERMISSION_HPP
#define HARMONIA_PERMISSION_HPP

#include <string>
#include <nlohmann/json.hpp>
#include <harmonia/flags.hpp>

/**
 *  \file permission.hpp
 *
 *  Defines enumeration Permission and Flags<Permission> alias.
 */

namespace Harmonia {
    /**
     *  \brief Permissions enumeration.
     *
     *  Permissions in Discord are a way to limit and grant certain abilities
     *  to users. A set of base permissions can be configured at the guild level
     *  for different roles, when these roles are attached to users they grant
     *  or revoke specific privileges within the guild. Along with the global
     *  guild-level permissions, Discord also supports role overwrites which
     *  can be set at the channel level allowing customization of permissions
     *  on a per-role, per-channel basis.
     *
     *  \internal
     *
     *  Permissions are stored within a 64-bit integer and sent over wire
     *  as decimal string.
     */
    enum Permission : uint64_t {
        CreateInstantInvite    = 1ull << 0,  /// Allows creation of instant invites.
        KickMembers            = 1ull << 1,  /// Allows kicking members.
        BanMembers             = 1ull << 2,  /// Allows banning members.
        Administrator          = 1ull << 3,  /// Allows all permissions and bypasses channel permission overwrites.
        ManageChannels         = 1ull << 4,  /// Allows management and editing of channels.
        ManageGuild            = 1ull << 5,  /// Allows management and editing of the guild.
        AddReactions           = 1ull << 6,  /// Allows for the addition of reactions to messages.
        ViewAuditLog           = 1ull << 7,  /// Allows for viewing of audit logs.
        PrioritySpeaker        = 1ull << 8,
        Stream                 = 1ull << 9,
        ViewChannel            = 1ull << 10, /// Allows reading messages in a channel. The channel will not appear for users without this permission.
        SendMessages           = 1ull << 11, /// Allows for sending messages in a channel.
        SendTtsMessages        = 1ull << 12, /// Allows for sending of /tts messages.
        ManageMessages         = 1ull << 13, /// Allows for deletion of other users messages.
        EmbedLinks             = 1ull << 14, /// Links sent by this user will be auto-embedded.
        AttachFiles            = 1ull << 15, /// Allows for uploading images and files.
        ReadMessageHistory     = 1ull << 16, /// Allows for reading of message history
        MentionEveryone        = 1ull << 17, /// Allows for using the `@everyone` and `@here` tags.
        UseExternalEmojis      = 1ull << 18, /// Allows the usage of custom emojis from other servers.
        ViewGuildInsights      = 1ull << 19,
        Connect                = 1ull << 20, /// Allows for joining of a voice channel.
        Speak                  = 1ull << 21, /// Allows for speaking in a voice channel.
        MuteMembers            = 1ull << 22, /// Allows for muting members in a voice channel.
        DeafenMembers          = 1ull << 23, /// Allows for deafening of members in a voice channel.
        MoveMembers            = 1ull << 24, /// Allows for moving of members between voice channels.
        UseVad                 = 1ull << 25, /// Allows for using voice-activity-detection in a voice channel.
        ChangeNickname         = 1ull << 26, /// Allows for modification of own nickname.
        ManageNicknames        = 1ull << 27, /// Allows for modification of other users nicknames.
        ManageRoles            = 1ull << 28, /// Allows management and editing of roles.
        ManageWebhooks         = 1ull << 29, /// Allows management and editing of webhooks.
        ManageGuildExpressions = 1ull << 30, /// Allows management of emojis and stickers.
        UseApplicationCommands = 1ull << 31,
        RequestToSpeak         = 1ull << 32,
        ManageEvents           = 1ull << 33,
        ManageThreads          = 1ull << 34,
        CreatePublicThreads    = 1ull << 35,
        CreatePrivateThreads   = 1ull << 36,
        UseExternalStickers    = 1ull << 37,
        SendMessagesInThreads  = 1ull << 38,
        UseEmbeddedActivities  = 1ull << 39,
        ModerateMembers        = 1ull << 40, /// Allows timing out users.
        ViewCreatorMonetizationAnalytics = 1ull << 41,
        UseSoundboard          = 1ull << 42,
        CreateGuildExpressions = 1ull << 43,
        CreateEvents           = 1ull << 44,
        UseExternalSounds      = 1ull << 45,
        SendVoiceMessages      = 1ull << 46,
    };

    using Permissions = Flags<Permission, uint64_t>;
    HARMONIA_DECLARE_FLAGS_OPERATORS(Permission, uint64_t)

    /// All permissions known to this library, used to mask values before sending.
    constexpr uint64_t AllPermissions = (1ull << 47) - 1;

    /// Serialized as decimal string, as API does.
    inline void to_json(nlohmann::json& json, const Permissions& permissions) {
        json = std::to_string(uint64_t(permissions));
    }

    /// Accepts both string and integer representation.
    inline void from_json(const nlohmann::json& json, Permissions& permissions) {
        if (json.is_string()) {
            permissions = Permissions(uint64_t(std::stoull(json.get<std::string>())));
        } else {
            permissions = Permissions(json.get<uint64_t>());
        }
    }
} // namespace Harmonia

#endif // HARMONIA_PERMISSION_HPP
