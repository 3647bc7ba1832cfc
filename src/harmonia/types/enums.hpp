#ifndef HARMONIA_TYPES_ENUMS_HPP
#define HARMONIA_TYPES_ENUMS_HPP

#include <harmonia/flags.hpp>

/**
 * \file enums.hpp
 *
 * Enumerations with values as sent over wire.
 */

namespace Harmonia {
    enum class ChannelType : int {
        GuildText          = 0,
        DM                 = 1,
        GuildVoice         = 2,
        GroupDM            = 3,
        GuildCategory      = 4,
        GuildAnnouncement  = 5,
        AnnouncementThread = 10,
        PublicThread       = 11,
        PrivateThread      = 12,
        GuildStageVoice    = 13,
        GuildDirectory     = 14,
        GuildForum         = 15,
    };

    /// Minutes of inactivity after which thread is archived.
    enum class AutoArchiveDuration : int {
        Hour    = 60,
        Day     = 1440,
        ThreeDays = 4320,
        Week    = 10080,
    };

    enum class StagePrivacyLevel : int {
        /// Stage instance is visible to only guild members.
        GuildOnly = 2,
    };

    /// Default sort order of forum posts.
    enum class ForumSortOrder : int {
        LatestActivity = 0,
        CreationDate   = 1,
    };

    enum class OverwriteType : int {
        Role   = 0,
        Member = 1,
    };

    enum class InviteTargetType : int {
        Stream              = 1,
        EmbeddedApplication = 2,
    };

    enum class ActivityType : int {
        Game      = 0,
        Streaming = 1,
        Listening = 2,
        Watching  = 3,
        Custom    = 4,
        Competing = 5,
    };

    enum class InteractionType : int {
        Ping                           = 1,
        ApplicationCommand             = 2,
        MessageComponent               = 3,
        ApplicationCommandAutocomplete = 4,
        ModalSubmit                    = 5,
    };

    enum class InteractionResponseType : int {
        Pong                                 = 1,
        ChannelMessageWithSource             = 4,
        DeferredChannelMessageWithSource     = 5,
        DeferredUpdateMessage                = 6,
        UpdateMessage                        = 7,
        ApplicationCommandAutocompleteResult = 8,
        Modal                                = 9,
    };

    enum class ApplicationCommandType : int {
        ChatInput = 1,
        User      = 2,
        Message   = 3,
    };

    enum class ApplicationCommandOptionType : int {
        SubCommand      = 1,
        SubCommandGroup = 2,
        String          = 3,
        Integer         = 4,
        Boolean         = 5,
        User            = 6,
        Channel         = 7,
        Role            = 8,
        Mentionable     = 9,
        Number          = 10,
        Attachment      = 11,
    };

    enum class AutoModEventType : int {
        MessageSend = 1,
    };

    enum class AutoModTriggerType : int {
        Keyword       = 1,
        Spam          = 3,
        KeywordPreset = 4,
        MentionSpam   = 5,
    };

    enum class ScheduledEventEntityType : int {
        StageInstance = 1,
        Voice         = 2,
        External      = 3,
    };

    enum class ScheduledEventPrivacyLevel : int {
        GuildOnly = 2,
    };

    enum class ScheduledEventStatus : int {
        Scheduled = 1,
        Active    = 2,
        Completed = 3,
        Canceled  = 4,
    };

    enum MessageFlag : uint32_t {
        Crossposted           = 1u << 0,
        IsCrosspost           = 1u << 1,
        SuppressEmbeds        = 1u << 2,
        SourceMessageDeleted  = 1u << 3,
        Urgent                = 1u << 4,
        HasThread             = 1u << 5,
        Ephemeral             = 1u << 6,
        Loading               = 1u << 7,
        FailedToMentionSomeRolesInThread = 1u << 8,
        SuppressNotifications = 1u << 12,
        IsVoiceMessage        = 1u << 13,
    };

    using MessageFlags = Flags<MessageFlag, uint32_t>;
    HARMONIA_DECLARE_FLAGS_OPERATORS(MessageFlag, uint32_t)
} // namespace Harmonia

#endif // HARMONIA_TYPES_ENUMS_HPP
