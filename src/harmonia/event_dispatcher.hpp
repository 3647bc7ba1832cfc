// Harmonia - Discord API library for C++11 using boost libraries.
// Copyright © 2017 Maks Mazurov (fox.cpp) <foxcpp@yandex.ru>
// 
// Permission is hereby granted, free of charge, to any person obtaining
// a copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included
// in all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
// OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
// IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
// DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
// TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
// OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#ifndef HARMONIA_EVENT_DISPATCHER_HPP
#define HARMONIA_EVENT_DISPATCHER_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

namespace Harmonia {
    /**
     *  \defgroup Events Gateway events
     *
     *  Event types known to \ref EventDispatcher. Events not listed here
     *  are passed to unknown event handlers with their raw name.
     */
    enum class Event {
        Ready,
        Resumed,
        ApplicationCommandPermissionsUpdate,
        AutoModerationRuleCreate,
        AutoModerationRuleUpdate,
        AutoModerationRuleDelete,
        AutoModerationActionExecution,
        ChannelCreate,
        ChannelUpdate,
        ChannelDelete,
        ChannelPinsUpdate,
        ThreadCreate,
        ThreadUpdate,
        ThreadDelete,
        ThreadListSync,
        ThreadMemberUpdate,
        ThreadMembersUpdate,
        GuildCreate,
        GuildUpdate,
        GuildDelete,
        GuildAuditLogEntryCreate,
        GuildBanAdd,
        GuildBanRemove,
        GuildEmojisUpdate,
        GuildStickersUpdate,
        GuildIntegrationsUpdate,
        GuildMemberAdd,
        GuildMemberRemove,
        GuildMemberUpdate,
        GuildMembersChunk,
        GuildRoleCreate,
        GuildRoleUpdate,
        GuildRoleDelete,
        GuildScheduledEventCreate,
        GuildScheduledEventUpdate,
        GuildScheduledEventDelete,
        GuildScheduledEventUserAdd,
        GuildScheduledEventUserRemove,
        IntegrationCreate,
        IntegrationUpdate,
        IntegrationDelete,
        InteractionCreate,
        InviteCreate,
        InviteDelete,
        MessageCreate,
        MessageUpdate,
        MessageDelete,
        MessageDeleteBulk,
        MessageReactionAdd,
        MessageReactionRemove,
        MessageReactionRemoveAll,
        MessageReactionRemoveEmoji,
        PresenceUpdate,
        StageInstanceCreate,
        StageInstanceUpdate,
        StageInstanceDelete,
        TypingStart,
        UserUpdate,
        VoiceStateUpdate,
        VoiceServerUpdate,
        WebhooksUpdate,
    };

    struct EventHash {
        inline std::size_t operator()(Event e) const noexcept {
            return static_cast<std::size_t>(e);
        }
    };

    class EventDispatcher {
    public:
        using EventHandler        = std::function<void(const nlohmann::json&)>;
        using UnknownEventHandler = std::function<void(const std::string&, const nlohmann::json&)>;

        void addHandler(Event eventType, EventHandler handler);

        /**
         *  Add handler for events without \ref Event value (new events
         *  not supported by this version).
         */
        void addUnknownEventHandler(UnknownEventHandler handler);

        /**
         *  Remove all handlers of this event type.
         */
        void removeHandlers(Event eventType);

        /**
         *  Call all handlers for event. Exceptions thrown by handlers are propagated.
         */
        void dispatchEvent(Event type, const nlohmann::json& payload) const;

        /**
         *  Same as above, but unknown event names are passed to unknown event handlers.
         */
        void dispatchEvent(const std::string& type, const nlohmann::json& payload) const;

        static boost::optional<Event> eventFromString(const std::string& name);
        static std::string eventToString(Event event);
    private:
        std::unordered_map<Event, std::vector<EventHandler>, EventHash> handlers;
        std::vector<UnknownEventHandler> unknownEventHandlers;
    };
} // namespace Harmonia

#endif // HARMONIA_EVENT_DISPATCHER_HPP
