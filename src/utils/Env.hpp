#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// A C++-like interface for manipulating environment variables.
class Env {
   public:
    Env() = default;

    class ValueEntry {
        std::string _key;

       public:
        explicit ValueEntry(const std::string_view key) : _key(key) {}
        // Aka, setenv
        const Env::ValueEntry& operator=(const std::string_view value) const;
        // Aka, unsetenv
        void clear() const;
        // Aka, getenv
        [[nodiscard]] std::optional<std::string> get() const;

        [[nodiscard]] bool has() const { return get().has_value(); }

        template <typename T>
        bool assign(T& ref) const {
            if (auto value = get(); value) {
                ref = *value;
                return true;
            }
            return false;
        }

        [[nodiscard]] std::string_view key() const { return _key; }

        ValueEntry() = delete;
    };

    ValueEntry operator[](const std::string_view key) const {
        return ValueEntry{key};
    }
};

inline std::ostream& operator<<(std::ostream& o, const Env::ValueEntry& entry) {
    if (auto value = entry.get(); value) {
        o << *value;
    } else {
        o << "(nonexistent variable " << entry.key() << ")";
    }
    return o;
}
