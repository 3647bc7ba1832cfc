#include <harmonia/types/components.hpp>
#include <harmonia/exceptions.hpp>
#include <harmonia/internal/utils.hpp>

namespace Harmonia {
    SelectOption::SelectOption(const std::string& label, const std::string& value,
                               const boost::optional<std::string>& description,
                               const nlohmann::json& emoji, bool isDefault)
        : label(label)
        , value(value)
        , description(description)
        , emoji(emoji)
        , isDefault(isDefault) {}

    void SelectOption::validate() const {
        if (label.empty() || Utils::utf8Length(label) > 100) {
            throw InvalidParameter("label", "label size out of range (should be 1-100).");
        }
        if (value.empty() || Utils::utf8Length(value) > 100) {
            throw InvalidParameter("value", "value size out of range (should be 1-100).");
        }
        if (description && Utils::utf8Length(*description) > 100) {
            throw InvalidParameter("description", "description size out of range (should be 0-100).");
        }
    }

    nlohmann::json SelectOption::toJson() const {
        validate();

        nlohmann::json result = {
            { "label", label },
            { "value", value }
        };
        if (description)      result["description"] = *description;
        if (!emoji.is_null()) result["emoji"]       = emoji;
        if (isDefault)        result["default"]     = true;
        return result;
    }

    nlohmann::json selectMenu(const std::string& customId,
                              const std::vector<SelectOption>& options,
                              const boost::optional<std::string>& placeholder,
                              unsigned minValues, unsigned maxValues,
                              bool disabled) {
        if (customId.empty() || Utils::utf8Length(customId) > 100) {
            throw InvalidParameter("customId", "customId size out of range (should be 1-100).");
        }
        if (options.empty() || options.size() > 25) {
            throw InvalidParameter("options", "options count out of range (should be 1-25).");
        }
        if (maxValues > 25 || minValues > maxValues) {
            throw InvalidParameter("maxValues", "should be 0 <= minValues <= maxValues <= 25.");
        }
        if (placeholder && Utils::utf8Length(*placeholder) > 150) {
            throw InvalidParameter("placeholder", "placeholder size out of range (should be 0-150).");
        }

        nlohmann::json jsonOptions = nlohmann::json::array();
        for (const SelectOption& option : options) {
            jsonOptions.push_back(option.toJson());
        }

        nlohmann::json result = {
            { "type",       3           },
            { "custom_id",  customId    },
            { "options",    jsonOptions },
            { "min_values", minValues   },
            { "max_values", maxValues   }
        };
        if (placeholder) result["placeholder"] = *placeholder;
        if (disabled)    result["disabled"]    = true;
        return result;
    }

    nlohmann::json button(ButtonStyle style, const std::string& label,
                          const std::string& customIdOrUrl,
                          const nlohmann::json& emoji, bool disabled) {
        if (Utils::utf8Length(label) > 80) {
            throw InvalidParameter("label", "label size out of range (should be 0-80).");
        }
        if (label.empty() && emoji.is_null()) {
            throw InvalidParameter("label", "button should have label or emoji.");
        }

        nlohmann::json result = {
            { "type",  2                       },
            { "style", static_cast<int>(style) }
        };
        if (style == ButtonStyle::Link) {
            result["url"] = customIdOrUrl;
        } else {
            if (customIdOrUrl.empty() || Utils::utf8Length(customIdOrUrl) > 100) {
                throw InvalidParameter("customId", "customId size out of range (should be 1-100).");
            }
            result["custom_id"] = customIdOrUrl;
        }
        if (!label.empty())   result["label"]    = label;
        if (!emoji.is_null()) result["emoji"]    = emoji;
        if (disabled)         result["disabled"] = true;
        return result;
    }

    nlohmann::json actionRow(const std::vector<nlohmann::json>& components) {
        if (components.empty() || components.size() > 5) {
            throw InvalidParameter("components", "action row components count out of range (should be 1-5).");
        }
        return {
            { "type",       1          },
            { "components", components }
        };
    }
} // namespace Harmonia
