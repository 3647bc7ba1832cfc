#ifndef HARMONIA_ROUTE_HPP
#define HARMONIA_ROUTE_HPP

#include <string>
#include <vector>
#include <utility>

/**
 * \file route.hpp
 *
 * Defines \ref Harmonia::Route, REST endpoint template with bound parameters.
 */

namespace Harmonia {
    /**
     * REST endpoint described as HTTP method, path template and values
     * for template placeholders.
     *
     * Template placeholders start with colon and consist of lowercase
     * letters and underscores:
     *
     *     Route("GET", "/channels/:channel_id/messages/:message_id",
     *           {{ "channel_id", "1" }, { "message_id", "2" }})
     *
     * Discord shares rate limits between requests to same route with same
     * "major" parameters (guild_id, channel_id, webhook_id and webhook
     * token), see \ref bucketKey.
     */
    class Route {
    public:
        using Parameters = std::vector<std::pair<std::string, std::string> >;

        Route(const std::string& method, const std::string& pathTemplate, const Parameters& parameters = {});

        const std::string& method() const { return method_; }
        const std::string& pathTemplate() const { return pathTemplate_; }
        const Parameters& parameters() const { return parameters_; }

        /**
         * Template with all placeholders substituted by URL-encoded values.
         *
         * \throws LogicError if some placeholder have no value.
         */
        std::string path() const;

        /**
         * "METHOD template" with only major parameters substituted.
         * Routes with equal keys share rate limit.
         */
        std::string bucketKey() const;

        /**
         * "METHOD template" without any substitution. Discord returns same
         * bucket hash for all routes with same template key.
         */
        std::string templateKey() const;

        /**
         * Values of major parameters joined with ':', in template order.
         * Empty if route have no major parameters.
         */
        std::string majorParameters() const;

        static bool isMajorParameter(const std::string& name);

    private:
        // Call callback for every literal part and placeholder.
        template<typename LiteralCallback, typename PlaceholderCallback>
        void walkTemplate(LiteralCallback literal, PlaceholderCallback placeholder) const;

        const std::string* findParameter(const std::string& name) const;

        std::string method_;
        std::string pathTemplate_;
        Parameters  parameters_;
    };
} // namespace Harmonia

#endif // HARMONIA_ROUTE_HPP
