#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "CommandLine.hpp"

/**
 * Layered configuration for the upload client.
 *
 * Each option is looked up in the command line, then the environment (bare
 * option name), then `$HOME/resumableupload.ini`. The first source that has
 * the option wins. Values are returned as strings; interpretation belongs to
 * the caller.
 */
class ConfigManager {
   public:
    enum class Configs {
        SERVER_URL,
        SOURCE_FILE,
        CHUNK_SIZE,
        RETRY_DELAY,
        UPLOAD_ID,
        CHECKSUM,
        CONNECT_TIMEOUT,
        FILENAME_METADATA,
        LOG_LEVEL,
        LOG_FILE,
        HELP,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<size_t>(Configs::MAX);

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        // Shown in help, e.g. --CHUNK_SIZE BYTES. Empty for flags.
        std::string_view valueName;

        // Flags carry no value and are only read from the command line
        [[nodiscard]] constexpr bool isFlag() const {
            return valueName.empty();
        }
    };

    // Indexed by Configs
    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {{
        {Configs::SERVER_URL, "SERVER_URL",
         "Server base URL (default http://localhost:8080)", 's', "URL"},
        {Configs::SOURCE_FILE, "SOURCE_FILE",
         "File to upload (default testfile)", 'f', "PATH"},
        {Configs::CHUNK_SIZE, "CHUNK_SIZE",
         "Bytes per append request (default 33554432)", 'c', "BYTES"},
        {Configs::RETRY_DELAY, "RETRY_DELAY",
         "Seconds to wait after a failed iteration (default 1)", 'r',
         "SECONDS"},
        {Configs::UPLOAD_ID, "UPLOAD_ID",
         "Resume an existing upload instead of creating one", 'u', "ID"},
        {Configs::CHECKSUM, "CHECKSUM", "Per-chunk checksum: none or md5",
         Entry::ALIAS_NONE, "ALGO"},
        {Configs::CONNECT_TIMEOUT, "CONNECT_TIMEOUT",
         "Connect timeout in seconds, 0 for the curl default (default 10)",
         Entry::ALIAS_NONE, "SECONDS"},
        {Configs::FILENAME_METADATA, "FILENAME_METADATA",
         "Send the file name as upload metadata: on or off",
         Entry::ALIAS_NONE, "on|off"},
        {Configs::LOG_LEVEL, "LOG_LEVEL",
         "trace, debug, info, warning, error or off (default debug)", 'l',
         "LEVEL"},
        {Configs::LOG_FILE, "LOG_FILE", "Also write the log to this file",
         Entry::ALIAS_NONE, "PATH"},
        {Configs::HELP, "HELP", "Display help information", 'h', ""},
    }};

    static constexpr const Entry& entryOf(Configs config) {
        return kConfigMap[static_cast<size_t>(config)];
    }

    struct Backend {
        virtual ~Backend() = default;

        // Raw value of the option, if this source has it
        virtual std::optional<std::string> get(const Entry& entry) = 0;

        // For logging, e.g. "Cmdline"
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

    static constexpr std::string_view kConfigFileName = "resumableupload.ini";

    explicit ConfigManager(CommandLine line);
    ~ConfigManager();

    // Value of `config` from the first source that has it
    std::optional<std::string> get(Configs config);

    // False if the command line could not be parsed; it is then ignored.
    [[nodiscard]] bool commandLineValid() const { return _cmdlineValid; }

    // $HOME/resumableupload.ini, nullopt if HOME is unset
    static std::optional<std::filesystem::path> configFilePath();

    // Writes the command line usage of every option
    static void serializeHelpToOStream(std::ostream& out);

   private:
    // Command line, environment, file
    std::vector<std::unique_ptr<Backend>> _backends;
    bool _cmdlineValid = false;
};
