#include <harmonia/types/interaction.hpp>
#include <harmonia/types/enums.hpp>
#include <harmonia/exceptions.hpp>

namespace Harmonia {
    boost::optional<nlohmann::json> findFocusedOption(const nlohmann::json& data) {
        auto optionsIt = data.find("options");
        if (optionsIt == data.end() || !optionsIt->is_array()) return boost::none;

        for (const nlohmann::json& option : *optionsIt) {
            auto focusedIt = option.find("focused");
            if (focusedIt != option.end() && focusedIt->is_boolean() && focusedIt->get<bool>()) {
                return option;
            }

            // Sub-command or sub-command group, look inside.
            auto nested = findFocusedOption(option);
            if (nested) return nested;
        }
        return boost::none;
    }

    nlohmann::json autocompleteResponse(const std::vector<nlohmann::json>& choices) {
        if (choices.size() > 25) {
            throw InvalidParameter("choices", "too many choices (should be 0-25).");
        }

        return {
            { "type", static_cast<int>(InteractionResponseType::ApplicationCommandAutocompleteResult) },
            { "data", {{ "choices", choices }} }
        };
    }
} // namespace Harmonia
