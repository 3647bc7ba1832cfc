#ifndef HARMONIA_TYPES_SNOWFLAKE_HPP
#define HARMONIA_TYPES_SNOWFLAKE_HPP

#include <cstdint>                     // uint64_t
#include <ctime>                       // time_t
#include <string>                      // std::string
#include <functional>                  // std::hash
#include <stdexcept>                   // std::out_of_range
#include <nlohmann/json.hpp>           // nlohmann::json
#include <harmonia/exceptions.hpp>     // InvalidParameter

namespace Harmonia {
    /**
     * Discord's unique ID. 64-bit integer with following layout:
     *
     *     63                 22  21    17  16    12  11        0
     *     [ ms since epoch  ][ worker  ][ process ][ increment ]
     *
     * Epoch is 2015-01-01T00:00:00Z (\ref discordEpochMs).
     */
    struct Snowflake {
        constexpr Snowflake() : value(0) {}
        constexpr Snowflake(uint64_t value) : value(value) {}
        /// \throws InvalidParameter if strvalue is not a decimal number fitting in 64 bits.
        explicit Snowflake(const std::string& strvalue) : value(parse(strvalue)) {}

        static uint64_t parse(const std::string& strvalue) {
            // std::stoull skips whitespace and accepts sign, "-1" would wrap around.
            if (strvalue.empty() || strvalue[0] < '0' || strvalue[0] > '9') {
                throw InvalidParameter("snowflake", "not an unsigned decimal number: " + strvalue);
            }

            std::size_t parsed = 0;
            uint64_t result = 0;
            try {
                result = std::stoull(strvalue, &parsed);
            } catch (const std::out_of_range&) {
                throw InvalidParameter("snowflake", "value does not fit in 64 bits: " + strvalue);
            }
            if (parsed != strvalue.size()) {
                throw InvalidParameter("snowflake", "not an unsigned decimal number: " + strvalue);
            }
            return result;
        }

        static constexpr uint64_t discordEpochMs = 1420070400000ull;

        /// Milliseconds since Unix epoch.
        constexpr uint64_t timestamp() const {
            return (value >> 22) + discordEpochMs;
        }

        constexpr time_t unixTimestamp() const {
            return static_cast<time_t>(timestamp() / 1000);
        }

        constexpr unsigned workerId() const  { return (value >> 17) & 0x1F; }
        constexpr unsigned processId() const { return (value >> 12) & 0x1F; }
        constexpr unsigned increment() const { return value & 0xFFF; }

        std::string toString() const { return std::to_string(value); }

        /**
         * Smallest snowflake with given creation time, useful for
         * before/after pagination by date.
         */
        static constexpr Snowflake fromTimestamp(uint64_t unixTimestampMs) {
            return Snowflake((unixTimestampMs - discordEpochMs) << 22);
        }

        constexpr operator uint64_t() const { return value; }

        uint64_t value;
    };

    /// Snowflakes are sent as strings, JS can't represent 64-bit integers.
    inline void to_json(nlohmann::json& json, const Snowflake& snowflake) {
        json = snowflake.toString();
    }

    inline void from_json(const nlohmann::json& json, Snowflake& snowflake) {
        if (json.is_string()) {
            snowflake.value = Snowflake::parse(json.get<std::string>());
        } else {
            snowflake.value = json.get<uint64_t>();
        }
    }
} // namespace Harmonia

namespace std {
    template<>
    struct hash<Harmonia::Snowflake> {
        inline size_t operator()(const Harmonia::Snowflake& snowflake) const {
            return std::hash<uint64_t>()(snowflake.value);
        }
    };
}

#endif // HARMONIA_TYPES_SNOWFLAKE_HPP
