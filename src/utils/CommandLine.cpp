#include <LogCompat.hpp>

#include <CommandLine.hpp>
#include <stdexcept>

CommandLine::CommandLine(argc_type argc, const char* const* argv) {
    if (argc < 1 || argv == nullptr || argv[0] == nullptr) {
        LOG(ERROR) << "Invalid argv passed";
        throw std::invalid_argument("Invalid argv passed");
    }
    _args.reserve(argc);
    for (argc_type i = 0; i < argc && argv[i] != nullptr; ++i) {
        _args.emplace_back(argv[i]);
    }
    rebuildPointers();
}

CommandLine::CommandLine(std::initializer_list<std::string> args)
    : _args(args) {
    if (_args.empty()) {
        throw std::invalid_argument("Empty command line");
    }
    rebuildPointers();
}

CommandLine::CommandLine(const CommandLine& other) : _args(other._args) {
    rebuildPointers();
}

CommandLine& CommandLine::operator=(const CommandLine& other) {
    if (this != &other) {
        _args = other._args;
        rebuildPointers();
    }
    return *this;
}

void CommandLine::rebuildPointers() {
    _pointers.clear();
    _pointers.reserve(_args.size() + 1);
    for (auto& arg : _args) {
        _pointers.emplace_back(arg.data());
    }
    _pointers.emplace_back(nullptr);
}
