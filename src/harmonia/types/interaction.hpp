#ifndef HARMONIA_TYPES_INTERACTION_HPP
#define HARMONIA_TYPES_INTERACTION_HPP

#include <vector>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

namespace Harmonia {
    /**
     * Find option user is currently typing in autocomplete interaction.
     *
     * \param data "data" object of interaction (with "options" array).
     *             Options of sub-commands and sub-command groups are searched too.
     *
     * \returns Option object with "focused": true or boost::none.
     */
    boost::optional<nlohmann::json> findFocusedOption(const nlohmann::json& data);

    /**
     * Build interaction response with autocomplete choices (type 8).
     *
     * \param choices Objects with "name" and "value" keys.
     *
     * \throws InvalidParameter if there are more than 25 choices.
     */
    nlohmann::json autocompleteResponse(const std::vector<nlohmann::json>& choices);
} // namespace Harmonia

#endif // HARMONIA_TYPES_INTERACTION_HPP
