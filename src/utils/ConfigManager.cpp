#include <LogCompat.hpp>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <memory>
#include <utility>

#include "Env.hpp"

namespace po = boost::program_options;

namespace {

constexpr bool isIndexedByConfig() {
    for (size_t i = 0; i < ConfigManager::CONFIG_MAX; ++i) {
        if (static_cast<size_t>(ConfigManager::kConfigMap[i].config) != i) {
            return false;
        }
    }
    return true;
}
static_assert(isIndexedByConfig(), "kConfigMap must follow Configs order");

// Flags only make sense on the command line
enum class OptionSet { Values, ValuesAndFlags };

po::options_description describeOptions(OptionSet set) {
    po::options_description desc("Resumable upload client options");
    for (const auto& entry : ConfigManager::kConfigMap) {
        if (entry.isFlag() && set == OptionSet::Values) {
            continue;
        }
        std::string spec(entry.name);
        if (entry.alias != ConfigManager::Entry::ALIAS_NONE) {
            spec = fmt::format("{},{}", entry.name, entry.alias);
        }
        const std::string description(entry.description);
        if (entry.isFlag()) {
            desc.add_options()(spec.c_str(), description.c_str());
        } else {
            desc.add_options()(
                spec.c_str(),
                po::value<std::string>()->value_name(
                    std::string(entry.valueName)),
                description.c_str());
        }
    }
    return desc;
}

// Answers from a parsed variables_map
class VariablesMapBackend : public ConfigManager::Backend {
   public:
    std::optional<std::string> get(
        const ConfigManager::Entry& entry) override {
        const auto it = _map.find(std::string(entry.name));
        if (it == _map.end()) {
            return std::nullopt;
        }
        if (entry.isFlag()) {
            // Presence is the value
            return std::string();
        }
        return it->second.as<std::string>();
    }

   protected:
    po::variables_map _map;
};

class CommandLineBackend : public VariablesMapBackend {
   public:
    explicit CommandLineBackend(CommandLine line) : _line(std::move(line)) {}

    bool load() {
        try {
            po::store(po::parse_command_line(
                          _line.argc(), _line.argv(),
                          describeOptions(OptionSet::ValuesAndFlags)),
                      _map);
        } catch (const po::error& e) {
            LOG(ERROR) << "Invalid command line: " << e.what();
            return false;
        }
        po::notify(_map);
        DLOG(INFO) << "Command line set " << _map.size() << " options";
        return true;
    }

    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

   private:
    CommandLine _line;
};

class ConfigFileBackend : public VariablesMapBackend {
   public:
    bool load(const std::filesystem::path& path) {
        std::ifstream ifs(path);
        if (!ifs) {
            DLOG(INFO) << "No config file at " << path;
            return false;
        }
        try {
            po::store(po::parse_config_file(
                          ifs, describeOptions(OptionSet::Values)),
                      _map);
        } catch (const po::error& e) {
            LOG(ERROR) << "Ignoring " << path << ": " << e.what();
            return false;
        }
        po::notify(_map);
        LOG(INFO) << "Loaded " << _map.size() << " options from " << path;
        return true;
    }

    [[nodiscard]] std::string_view name() const override { return "File"; }
};

class EnvironmentBackend : public ConfigManager::Backend {
   public:
    std::optional<std::string> get(
        const ConfigManager::Entry& entry) override {
        if (entry.isFlag()) {
            return std::nullopt;
        }
        return Env::get(entry.name);
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

}  // namespace

ConfigManager::ConfigManager(CommandLine line) {
    auto cmdline = std::make_unique<CommandLineBackend>(std::move(line));
    _cmdlineValid = cmdline->load();
    if (_cmdlineValid) {
        _backends.emplace_back(std::move(cmdline));
    }

    _backends.emplace_back(std::make_unique<EnvironmentBackend>());

    if (const auto path = configFilePath(); path) {
        auto file = std::make_unique<ConfigFileBackend>();
        if (file->load(*path)) {
            _backends.emplace_back(std::move(file));
        }
    } else {
        LOG(WARNING) << "HOME is not set, skipping config file";
    }
}

ConfigManager::~ConfigManager() = default;

std::optional<std::string> ConfigManager::get(Configs config) {
    const Entry& entry = entryOf(config);
    for (const auto& backend : _backends) {
        auto value = backend->get(entry);
        if (value) {
            DLOG(INFO) << fmt::format("{} taken from {}", entry.name,
                                      backend->name());
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> ConfigManager::configFilePath() {
    const auto home = Env::get("HOME");
    if (!home || home->empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(*home) / kConfigFileName;
}

void ConfigManager::serializeHelpToOStream(std::ostream& out) {
    out << describeOptions(OptionSet::ValuesAndFlags) << std::endl;
}
