#include <harmonia/event_dispatcher.hpp>
#include <harmonia/config.hpp>

#if defined(HARMONIA_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "event_dispatcher.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Harmonia {
    namespace {
        const std::unordered_map<std::string, Event>& stringToEnum() {
            static const std::unordered_map<std::string, Event> table {
                { "READY",                                   Event::Ready },
                { "RESUMED",                                 Event::Resumed },
                { "APPLICATION_COMMAND_PERMISSIONS_UPDATE",  Event::ApplicationCommandPermissionsUpdate },
                { "AUTO_MODERATION_RULE_CREATE",             Event::AutoModerationRuleCreate },
                { "AUTO_MODERATION_RULE_UPDATE",             Event::AutoModerationRuleUpdate },
                { "AUTO_MODERATION_RULE_DELETE",             Event::AutoModerationRuleDelete },
                { "AUTO_MODERATION_ACTION_EXECUTION",        Event::AutoModerationActionExecution },
                { "CHANNEL_CREATE",                          Event::ChannelCreate },
                { "CHANNEL_UPDATE",                          Event::ChannelUpdate },
                { "CHANNEL_DELETE",                          Event::ChannelDelete },
                { "CHANNEL_PINS_UPDATE",                     Event::ChannelPinsUpdate },
                { "THREAD_CREATE",                           Event::ThreadCreate },
                { "THREAD_UPDATE",                           Event::ThreadUpdate },
                { "THREAD_DELETE",                           Event::ThreadDelete },
                { "THREAD_LIST_SYNC",                        Event::ThreadListSync },
                { "THREAD_MEMBER_UPDATE",                    Event::ThreadMemberUpdate },
                { "THREAD_MEMBERS_UPDATE",                   Event::ThreadMembersUpdate },
                { "GUILD_CREATE",                            Event::GuildCreate },
                { "GUILD_UPDATE",                            Event::GuildUpdate },
                { "GUILD_DELETE",                            Event::GuildDelete },
                { "GUILD_AUDIT_LOG_ENTRY_CREATE",            Event::GuildAuditLogEntryCreate },
                { "GUILD_BAN_ADD",                           Event::GuildBanAdd },
                { "GUILD_BAN_REMOVE",                        Event::GuildBanRemove },
                { "GUILD_EMOJIS_UPDATE",                     Event::GuildEmojisUpdate },
                { "GUILD_STICKERS_UPDATE",                   Event::GuildStickersUpdate },
                { "GUILD_INTEGRATIONS_UPDATE",               Event::GuildIntegrationsUpdate },
                { "GUILD_MEMBER_ADD",                        Event::GuildMemberAdd },
                { "GUILD_MEMBER_REMOVE",                     Event::GuildMemberRemove },
                { "GUILD_MEMBER_UPDATE",                     Event::GuildMemberUpdate },
                { "GUILD_MEMBERS_CHUNK",                     Event::GuildMembersChunk },
                { "GUILD_ROLE_CREATE",                       Event::GuildRoleCreate },
                { "GUILD_ROLE_UPDATE",                       Event::GuildRoleUpdate },
                { "GUILD_ROLE_DELETE",                       Event::GuildRoleDelete },
                { "GUILD_SCHEDULED_EVENT_CREATE",            Event::GuildScheduledEventCreate },
                { "GUILD_SCHEDULED_EVENT_UPDATE",            Event::GuildScheduledEventUpdate },
                { "GUILD_SCHEDULED_EVENT_DELETE",            Event::GuildScheduledEventDelete },
                { "GUILD_SCHEDULED_EVENT_USER_ADD",          Event::GuildScheduledEventUserAdd },
                { "GUILD_SCHEDULED_EVENT_USER_REMOVE",       Event::GuildScheduledEventUserRemove },
                { "INTEGRATION_CREATE",                      Event::IntegrationCreate },
                { "INTEGRATION_UPDATE",                      Event::IntegrationUpdate },
                { "INTEGRATION_DELETE",                      Event::IntegrationDelete },
                { "INTERACTION_CREATE",                      Event::InteractionCreate },
                { "INVITE_CREATE",                           Event::InviteCreate },
                { "INVITE_DELETE",                           Event::InviteDelete },
                { "MESSAGE_CREATE",                          Event::MessageCreate },
                { "MESSAGE_UPDATE",                          Event::MessageUpdate },
                { "MESSAGE_DELETE",                          Event::MessageDelete },
                { "MESSAGE_DELETE_BULK",                     Event::MessageDeleteBulk },
                { "MESSAGE_REACTION_ADD",                    Event::MessageReactionAdd },
                { "MESSAGE_REACTION_REMOVE",                 Event::MessageReactionRemove },
                { "MESSAGE_REACTION_REMOVE_ALL",             Event::MessageReactionRemoveAll },
                { "MESSAGE_REACTION_REMOVE_EMOJI",           Event::MessageReactionRemoveEmoji },
                { "PRESENCE_UPDATE",                         Event::PresenceUpdate },
                { "STAGE_INSTANCE_CREATE",                   Event::StageInstanceCreate },
                { "STAGE_INSTANCE_UPDATE",                   Event::StageInstanceUpdate },
                { "STAGE_INSTANCE_DELETE",                   Event::StageInstanceDelete },
                { "TYPING_START",                            Event::TypingStart },
                { "USER_UPDATE",                             Event::UserUpdate },
                { "VOICE_STATE_UPDATE",                      Event::VoiceStateUpdate },
                { "VOICE_SERVER_UPDATE",                     Event::VoiceServerUpdate },
                { "WEBHOOKS_UPDATE",                         Event::WebhooksUpdate }
            };
            return table;
        }
    }

    boost::optional<Event> EventDispatcher::eventFromString(const std::string& name) {
        auto it = stringToEnum().find(name);
        if (it == stringToEnum().end()) return boost::none;
        return it->second;
    }

    std::string EventDispatcher::eventToString(Event event) {
        for (const auto& pair : stringToEnum()) {
            if (pair.second == event) return pair.first;
        }
        return std::string();
    }

    void EventDispatcher::addHandler(Event eventType, EventDispatcher::EventHandler handler) {
        handlers[eventType].push_back(std::move(handler));
    }

    void EventDispatcher::addUnknownEventHandler(EventDispatcher::UnknownEventHandler handler) {
        unknownEventHandlers.push_back(std::move(handler));
    }

    void EventDispatcher::removeHandlers(Event eventType) {
        handlers.erase(eventType);
    }

    void EventDispatcher::dispatchEvent(Event type, const nlohmann::json& payload) const {
        auto it = handlers.find(type);
        if (it == handlers.end()) return;

        for (const auto& handler : it->second) {
            handler(payload);
        }
    }

    void EventDispatcher::dispatchEvent(const std::string& type, const nlohmann::json& payload) const {
        boost::optional<Event> event = eventFromString(type);
        if (!event) { // we got unknown event.
            DEBUG_MSG(std::string("Unknown event: ") + type);
            for (const auto& handler : unknownEventHandlers) {
                handler(type, payload);
            }
            return;
        }

        dispatchEvent(*event, payload);
    }
} // namespace Harmonia
