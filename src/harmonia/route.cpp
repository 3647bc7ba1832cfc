#include <harmonia/route.hpp>
#include <harmonia/exceptions.hpp>      // LogicError
#include <harmonia/internal/utils.hpp>  // Utils::urlEncode

namespace Harmonia {
    namespace {
        inline bool isPlaceholderChar(char ch) {
            return (ch >= 'a' && ch <= 'z') || ch == '_';
        }
    }

    Route::Route(const std::string& method, const std::string& pathTemplate, const Route::Parameters& parameters)
        : method_(method)
        , pathTemplate_(pathTemplate)
        , parameters_(parameters) {}

    bool Route::isMajorParameter(const std::string& name) {
        return name == "guild_id" || name == "channel_id" || name == "webhook_id" || name == "webhook_token";
    }

    template<typename LiteralCallback, typename PlaceholderCallback>
    void Route::walkTemplate(LiteralCallback literal, PlaceholderCallback placeholder) const {
        std::string::size_type pos = 0;
        while (pos < pathTemplate_.size()) {
            auto colon = pathTemplate_.find(':', pos);
            if (colon == std::string::npos) {
                literal(pathTemplate_.substr(pos));
                return;
            }
            literal(pathTemplate_.substr(pos, colon - pos));

            auto nameEnd = colon + 1;
            while (nameEnd < pathTemplate_.size() && isPlaceholderChar(pathTemplate_[nameEnd])) ++nameEnd;

            placeholder(pathTemplate_.substr(colon + 1, nameEnd - colon - 1));
            pos = nameEnd;
        }
    }

    const std::string* Route::findParameter(const std::string& name) const {
        for (const auto& parameter : parameters_) {
            if (parameter.first == name) return &parameter.second;
        }
        return nullptr;
    }

    std::string Route::path() const {
        std::string result;
        walkTemplate([&result](const std::string& part) {
            result += part;
        }, [this, &result](const std::string& name) {
            const std::string* value = findParameter(name);
            if (!value) {
                throw LogicError(std::string("Missing value for route parameter :") + name + " in " + pathTemplate_, -1);
            }
            result += Utils::urlEncode(*value);
        });
        return result;
    }

    std::string Route::bucketKey() const {
        std::string result = method_ + " ";
        walkTemplate([&result](const std::string& part) {
            result += part;
        }, [this, &result](const std::string& name) {
            const std::string* value = isMajorParameter(name) ? findParameter(name) : nullptr;
            if (value) {
                result += *value;
            } else {
                result += ':' + name;
            }
        });
        return result;
    }

    std::string Route::templateKey() const {
        return method_ + " " + pathTemplate_;
    }

    std::string Route::majorParameters() const {
        std::string result;
        walkTemplate([](const std::string&) {}, [this, &result](const std::string& name) {
            if (!isMajorParameter(name)) return;

            const std::string* value = findParameter(name);
            if (!value) return;

            if (!result.empty()) result += ':';
            result += *value;
        });
        return result;
    }
} // namespace Harmonia
