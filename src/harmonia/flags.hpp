#ifndef HARMONIA_FLAGS_HPP
#define HARMONIA_FLAGS_HPP

#include <cstdint>          // uint32_t, uint64_t
#include <initializer_list> // std::initializer_list

namespace Harmonia {
    /**
     *  Type-safe wrapper for OR-ed flags.
     *
     *  This class satisfies requirements of BitmaskType concept.
     *
     *  \tparam Flag    Usually enum but also can be any type which have
     *                  valid bitwise operators that return Storage.
     *  \tparam Storage Type to use for OR-ed flags store. Following requirement
     *                  should be met: sizeof(Flag) <= sizeof(Storage)
     */
    template<typename Flag, typename Storage = uint32_t>
    class Flags {
    public:
        static_assert((sizeof(Flag) <= sizeof(Storage)), "Flags<> uses Storage type not enough to hold values of Flag.");

        using StorageType = Storage;

        Flags() = default;

        /**
         *  Construct Flags from OR-ed flags.
         *
         *  \warning No checks performed thus no type safety.
         */
        explicit constexpr Flags(Storage flags) noexcept : set_(flags) {}

        /**
         *  Construct Flags with a single flag set.
         */
        constexpr Flags(Flag flag) noexcept : set_(static_cast<Storage>(flag)) {}

        Flags(std::initializer_list<Flag> il) noexcept {
            for (Flag flag : il) {
                set_ |= static_cast<Storage>(flag);
            }
        }

        constexpr bool get(Flag flag) const noexcept {
            return (set_ & static_cast<Storage>(flag)) == static_cast<Storage>(flag);
        }

        void set(Flag flag, bool value = true) noexcept {
            if (value) {
                set_ |= static_cast<Storage>(flag);
            } else {
                set_ &= ~static_cast<Storage>(flag);
            }
        }

        constexpr bool operator!() const noexcept {
            return set_ == 0;
        }

        constexpr operator Storage() const noexcept {
            return set_;
        }

        constexpr Flags operator~() const noexcept {
            return Flags(static_cast<Storage>(~set_));
        }

        constexpr Flags operator&(Flag flag) const noexcept {
            return Flags(static_cast<Storage>(set_ & static_cast<Storage>(flag)));
        }

        constexpr Flags operator|(Flag flag) const noexcept {
            return Flags(static_cast<Storage>(set_ | static_cast<Storage>(flag)));
        }

        constexpr Flags operator^(Flag flag) const noexcept {
            return Flags(static_cast<Storage>(set_ ^ static_cast<Storage>(flag)));
        }

        Flags& operator|=(Flag flag) noexcept {
            set_ |= static_cast<Storage>(flag);
            return *this;
        }

        constexpr Flags operator&(const Flags& flags) const noexcept {
            return Flags(static_cast<Storage>(set_ & flags.set_));
        }

        constexpr Flags operator|(const Flags& flags) const noexcept {
            return Flags(static_cast<Storage>(set_ | flags.set_));
        }

        constexpr Flags operator^(const Flags& flags) const noexcept {
            return Flags(static_cast<Storage>(set_ ^ flags.set_));
        }

        Flags& operator&=(const Flags& flags) noexcept {
            set_ &= flags.set_;
            return *this;
        }

        Flags& operator|=(const Flags& flags) noexcept {
            set_ |= flags.set_;
            return *this;
        }

        Flags& operator^=(const Flags& flags) noexcept {
            set_ ^= flags.set_;
            return *this;
        }

        constexpr bool operator==(const Flags& other) const noexcept {
            return set_ == other.set_;
        }

        constexpr bool operator!=(const Flags& other) const noexcept {
            return set_ != other.set_;
        }
    private:
        Storage set_ = 0;
    };

#define HARMONIA_DECLARE_FLAGS_OPERATORS(flagtype, storage) \
        constexpr inline Flags<flagtype, storage> operator|(flagtype lhs, flagtype rhs) noexcept { \
            return Flags<flagtype, storage>(static_cast<storage>(static_cast<storage>(lhs) | static_cast<storage>(rhs))); \
        } \
        constexpr inline Flags<flagtype, storage> operator|(flagtype lhs, Flags<flagtype, storage> rhs) noexcept { \
            return Flags<flagtype, storage>(lhs) | rhs; \
        }

} // namespace Harmonia

#endif // HARMONIA_FLAGS_HPP
