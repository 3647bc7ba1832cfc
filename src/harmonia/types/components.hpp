#ifndef HARMONIA_TYPES_COMPONENTS_HPP
#define HARMONIA_TYPES_COMPONENTS_HPP

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

/**
 * \file components.hpp
 *
 * Builders for message components (action rows, buttons, select menus).
 * Builders validate limits and return plain JSON, ready to be put into
 * \ref OutgoingMessage::components.
 */

namespace Harmonia {
    enum class ButtonStyle : int {
        Primary   = 1,
        Secondary = 2,
        Success   = 3,
        Danger    = 4,
        Link      = 5,
    };

    /**
     * Option of string select menu.
     */
    struct SelectOption {
        SelectOption(const std::string& label, const std::string& value,
                     const boost::optional<std::string>& description = boost::none,
                     const nlohmann::json& emoji = nullptr,
                     bool isDefault = false);

        /// User-facing name, max 100 characters.
        std::string label;

        /// Dev-defined value, max 100 characters.
        std::string value;

        /// Additional description, max 100 characters.
        boost::optional<std::string> description;

        /// Partial emoji object (id, name, animated), null if none.
        nlohmann::json emoji;

        /// Whether option is selected by default.
        bool isDefault;

        /**
         * \throws InvalidParameter if label, value or description is too long
         *         or label/value is empty.
         */
        void validate() const;

        nlohmann::json toJson() const;
    };

    /**
     * Build string select menu (type 3).
     *
     * \throws InvalidParameter if options count is not 1-25,
     *         minValues > maxValues or maxValues > 25,
     *         custom id is empty or longer than 100 characters.
     */
    nlohmann::json selectMenu(const std::string& customId,
                              const std::vector<SelectOption>& options,
                              const boost::optional<std::string>& placeholder = boost::none,
                              unsigned minValues = 1, unsigned maxValues = 1,
                              bool disabled = false);

    /**
     * Build interactive button (type 2). For \ref ButtonStyle::Link pass URL
     * instead of custom id.
     *
     * \throws InvalidParameter if label is longer than 80 characters or
     *         custom id is longer than 100 characters.
     */
    nlohmann::json button(ButtonStyle style, const std::string& label,
                          const std::string& customIdOrUrl,
                          const nlohmann::json& emoji = nullptr,
                          bool disabled = false);

    /**
     * Wrap components into action row (type 1).
     *
     * \throws InvalidParameter if there are no components or more than 5.
     */
    nlohmann::json actionRow(const std::vector<nlohmann::json>& components);
} // namespace Harmonia

#endif // HARMONIA_TYPES_COMPONENTS_HPP
