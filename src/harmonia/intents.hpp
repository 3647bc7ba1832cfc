#ifndef HARMONIA_INTENTS_HPP
#define HARMONIA_INTENTS_HPP

#include <harmonia/flags.hpp>

/**
 *  \file intents.hpp
 *
 *  Gateway intents: which event groups client wants to receive.
 */

namespace Harmonia {
    enum GatewayIntent : uint32_t {
        GuildsIntent                      = 1u << 0,
        GuildMembersIntent                = 1u << 1,  /// Privileged.
        GuildModerationIntent             = 1u << 2,
        GuildEmojisAndStickersIntent      = 1u << 3,
        GuildIntegrationsIntent           = 1u << 4,
        GuildWebhooksIntent               = 1u << 5,
        GuildInvitesIntent                = 1u << 6,
        GuildVoiceStatesIntent            = 1u << 7,
        GuildPresencesIntent              = 1u << 8,  /// Privileged.
        GuildMessagesIntent               = 1u << 9,
        GuildMessageReactionsIntent       = 1u << 10,
        GuildMessageTypingIntent          = 1u << 11,
        DirectMessagesIntent              = 1u << 12,
        DirectMessageReactionsIntent      = 1u << 13,
        DirectMessageTypingIntent         = 1u << 14,
        MessageContentIntent              = 1u << 15, /// Privileged.
        GuildScheduledEventsIntent        = 1u << 16,
        AutoModerationConfigurationIntent = 1u << 20,
        AutoModerationExecutionIntent     = 1u << 21,
    };

    using Intents = Flags<GatewayIntent, uint32_t>;
    HARMONIA_DECLARE_FLAGS_OPERATORS(GatewayIntent, uint32_t)

    /// Every intent that doesn't require approval in developer portal.
    constexpr uint32_t NonPrivilegedIntents = 0x317EFDu;
} // namespace Harmonia

#endif // HARMONIA_INTENTS_HPP
