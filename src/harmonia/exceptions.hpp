#ifndef HARMONIA_EXCEPTIONS_HPP
#define HARMONIA_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>

/**
 * \file exceptions.hpp
 *
 * This file defines set of exceptions thrown by Harmonia.
 */

namespace Harmonia {
    using ConnectionError = boost::system::system_error;

    /// Base class for errors that can't be predicted in most cases.
    class RuntimeError : public std::runtime_error {
    public:
        RuntimeError(const std::string& message, int errorCode)
            : std::runtime_error(message), message(message), code(errorCode) {}

        const std::string message;
        const int         code;
    };

    /// Base class for errors that can be predicted in most cases.
    class LogicError : public std::logic_error {
    public:
        LogicError(const std::string& message, int errorCode)
            : std::logic_error(message), message(message), code(errorCode) {}

        const std::string message;
        const int         code;
    };

    /// The class for errors in REST API.
    /// Some errors have separate classes, which inherit RESTError.
    class RESTError : public LogicError {
    public:
        RESTError(const std::string& message = "Unknown REST API error", int errorCode = -1, int httpCode = -1,
                  const nlohmann::json& errors = nullptr)
            : LogicError(message, errorCode), httpCode(httpCode), errors(errors) {}

        const int httpCode;

        /// Raw "errors" object from response body, null if absent.
        const nlohmann::json errors;
    };

    /// Thrown on 429 Too Many Requests if HARMONIA_RATELIMIT_HIT_AS_ERROR is set
    /// or HARMONIA_MAX_RETRIES retries failed.
    class RatelimitHit : public RESTError {
    public:
        RatelimitHit(const std::string& route, double retryAfter = 0.0, bool global = false)
            : RESTError(std::string("Ratelimit hit for route ") + route, -1, 429)
            , route(route), retryAfter(retryAfter), global(global) {}

        /// Route template ("GET /channels/:channel_id"), never contains tokens.
        const std::string route;

        /// Seconds until request can be repeated.
        const double retryAfter;

        /// Whether limit is global (all routes blocked).
        const bool global;
    };

    /// Thrown when client tries to access non-existent entity (probably invalid snowflake).
    /// See entityType for details.
    class UnknownEntity : public RESTError {
    public:
        enum Entity : int {
            Account                   = 1,
            Application               = 2,
            Channel                   = 3,
            Guild                     = 4,
            Integration               = 5,
            Invite                    = 6,
            Member                    = 7,
            Message                   = 8,
            Overwrite                 = 9,
            Provider                  = 10,
            Role                      = 11,
            Token                     = 12,
            User                      = 13,
            Emoji                     = 14,
            Webhook                   = 15,
            WebhookService            = 16,
            Session                   = 20,
            Ban                       = 26,
            GuildTemplate             = 57,
            Sticker                   = 60,
            Interaction               = 62,
            ApplicationCommand        = 63,
            VoiceState                = 65,
            ApplicationCommandPermissions = 66,
            StageInstance             = 67,
            MembershipScreening       = 68,
            WelcomeScreen             = 69,
            ScheduledEvent            = 70,
            ScheduledEventUser        = 71,
        };

        UnknownEntity(const std::string& message, int errorCode, int httpCode = 404)
            : RESTError(message, errorCode, httpCode), entityType(Entity(errorCode % 10000)) {}

        const Entity entityType;
    };

    /// Thrown if client reaches some limitation (except ratelimit, which have separate
    /// exception), use type to determine what happened.
    /// \sa \ref RatelimitHit
    class LimitReached : public RESTError {
    public:
        enum Type : int {
            Guilds           = 1,
            Friends          = 2,
            Pins             = 3,
            Recipients       = 4,
            GuildRoles       = 5,
            Webhooks         = 7,
            Emojis           = 8,
            Reactions        = 10,
            GuildChannels    = 13,
            Attachments      = 15,
            Invites          = 16,
            AnimatedEmojis   = 18,
            ThreadMembers    = 33,
            Stickers         = 39,
            PruneRequests    = 40,
        };

        LimitReached(const std::string& message, int errorCode, int httpCode = 400)
            : RESTError(message, errorCode, httpCode), type(Type(errorCode % 30000)) {}

        /// Limit of what hit.
        const Type type;
    };

    /// Thrown if either pre-request parameter validation fails or server returns
    /// message about invalid parameter.
    /// Errors parameter contained in \ref parameter, error description in \ref description.
    /// \note Name in parameter may or not may be same as exact invalid parameter name.
    class InvalidParameter : public RESTError {
    public:
        InvalidParameter(const std::string& parameter, const std::string& message,
                         int errorCode = -1, const nlohmann::json& errors = nullptr)
            : RESTError(std::string("Invalid parameter: ") + parameter + ", " + message, errorCode, 400, errors)
            , parameter(parameter), description(message) {}

        const std::string parameter;
        const std::string description;
    };

    /// 401 Unauthorized, token is missing or invalid.
    class Unauthorized : public RESTError {
    public:
        Unauthorized(const std::string& message, int errorCode = -1)
            : RESTError(message, errorCode, 401) {}
    };

    /// 403 Forbidden, usually missing permissions.
    class Forbidden : public RESTError {
    public:
        Forbidden(const std::string& message, int errorCode = -1)
            : RESTError(message, errorCode, 403) {}
    };

    /// 404 without "unknown entity" API code (unknown route).
    class NotFound : public RESTError {
    public:
        NotFound(const std::string& message, int errorCode = -1)
            : RESTError(message, errorCode, 404) {}
    };

    /// 413 Payload Too Large, uploaded files exceed limit.
    class RequestTooLarge : public RESTError {
    public:
        RequestTooLarge(const std::string& message, int errorCode = -1)
            : RESTError(message, errorCode, 413) {}
    };

    /// 5xx, Discord failed to process request.
    class ServerError : public RESTError {
    public:
        ServerError(const std::string& message, int httpCode, int errorCode = -1)
            : RESTError(message, errorCode, httpCode) {}
    };

    /**
     *  Thrown if gateway API error occurs (fatal close code, unexpected message, etc).
     */
    class GatewayError : public RuntimeError {
    public:
        GatewayError(const std::string& message, int disconnectCode = -1)
            : RuntimeError(message, disconnectCode)
            , disconnectCode(disconnectCode) {}

        /**
         *  Contains gateway disconnect code if error caused
         *  by disconnection, -1 otherwise.
         */
        const int disconnectCode;
    };
} // namespace Harmonia

#endif // HARMONIA_EXCEPTIONS_HPP
