#pragma once

#include <optional>
#include <string>
#include <string_view>

// Process environment access.
class Env {
   public:
    // getenv, nullopt if unset
    static std::optional<std::string> get(std::string_view key);
    // setenv, overwriting
    static void set(std::string_view key, std::string_view value);
    // unsetenv
    static void unset(std::string_view key);

    // Overrides (or unsets) a variable and puts the old value back when
    // destroyed.
    class Scoped {
       public:
        Scoped(std::string key, std::optional<std::string> value);
        ~Scoped();

        Scoped(const Scoped&) = delete;
        Scoped& operator=(const Scoped&) = delete;

       private:
        std::string _key;
        std::optional<std::string> _previous;
    };
};
