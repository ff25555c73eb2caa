#include <cstdlib>
#include <string>
#include <utility>

#include "Env.hpp"

std::optional<std::string> Env::get(std::string_view key) {
    const std::string name(key);
    const char* value = getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return value;
}

void Env::set(std::string_view key, std::string_view value) {
    setenv(std::string(key).c_str(), std::string(value).c_str(), 1);
}

void Env::unset(std::string_view key) { unsetenv(std::string(key).c_str()); }

Env::Scoped::Scoped(std::string key, std::optional<std::string> value)
    : _key(std::move(key)), _previous(Env::get(_key)) {
    if (value) {
        Env::set(_key, *value);
    } else {
        Env::unset(_key);
    }
}

Env::Scoped::~Scoped() {
    if (_previous) {
        Env::set(_key, *_previous);
    } else {
        Env::unset(_key);
    }
}
