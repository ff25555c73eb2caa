#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

// Owned copy of the process arguments, argv[0] included.
class CommandLine {
   public:
    using argv_type = char* const*;
    using argc_type = int;

    // Throws std::invalid_argument if argv is null or empty.
    CommandLine(argc_type argc, const char* const* argv);
    CommandLine(std::initializer_list<std::string> args);

    CommandLine(const CommandLine& other);
    CommandLine& operator=(const CommandLine& other);
    CommandLine(CommandLine&& other) noexcept = default;
    CommandLine& operator=(CommandLine&& other) noexcept = default;
    ~CommandLine() = default;

    // Null terminated, valid as long as this object is
    [[nodiscard]] argv_type argv() const { return _pointers.data(); }
    [[nodiscard]] argc_type argc() const {
        return static_cast<argc_type>(_args.size());
    }
    [[nodiscard]] std::filesystem::path exe() const { return _args.front(); }
    [[nodiscard]] const std::vector<std::string>& args() const { return _args; }

    bool operator==(const CommandLine& other) const {
        return _args == other._args;
    }

   private:
    std::vector<std::string> _args;
    std::vector<char*> _pointers;

    void rebuildPointers();
};
