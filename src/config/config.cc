#include "config.hpp"

#include "config/config_file.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

using namespace minpatch;

static std::string config_doc_general = R"foo(# General configuration for `minpatch`
#
# Configure default options. These can be overriden with command-line arguments.
#
#   verbose        print debug messages (-V)
#   quiet          print errors only (-q)
#   backup_suffix  when patching in place (-i), keep the original file
#                  next to the result with this suffix, e.g. '.orig'
#
)foo";

enum class ConfigVariableType {
    Bool,
    String,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
minpatch::config_get_directory() {
    return fmt::format("{}/minpatch", sago::getConfigHome());
}

static ConfigLoadResult
config_load_file(const std::string& config_path, ConfigTable& config_table, ParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Ok;
    }

    std::error_code ec;
    if (load_result.kind == ParseErrorKind::File && !std::filesystem::exists(config_path, ec)) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

static void
config_save(const std::string& config_root, const std::string& config_path, const ConfigTable& config_table) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        log_warning(fmt::format("failed to create '{}': {}", config_root, ec.message()));
        return;
    }

    if (!writefile(config_path, config_doc_general + cfg_serialize(config_table))) {
        log_warning(fmt::format("default configuration was not saved to '{}'", config_path));
    }
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static void
apply_option_vector(ConfigTable& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            bool type_matches = true;
            switch (type) {
                case ConfigVariableType::Bool: {
                    type_matches = stored_value->type == ConfigValue::Type::Bool;
                    if (type_matches)
                        *((bool*) ptr) = stored_value->as_bool;
                } break;
                case ConfigVariableType::String: {
                    type_matches = stored_value->type == ConfigValue::Type::String;
                    if (type_matches)
                        *((std::string*) ptr) = stored_value->as_string;
                } break;
            }
            if (!type_matches) {
                log_warning(fmt::format("ignoring configuration value '{}': wrong type", path));
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            bool stored = false;
            switch (type) {
                case ConfigVariableType::Bool: {
                    stored = config.set_value_at(path, ConfigValue::from_bool(*(bool*) ptr));
                } break;
                case ConfigVariableType::String: {
                    stored = config.set_value_at(path, ConfigValue::from_string(*(std::string*) ptr));
                } break;
            }
            if (!stored) {
                log_warning(fmt::format("default value of '{}' can't be stored in the configuration file", path));
            }
        }
    }
}

void
minpatch::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "minpatch.conf";
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    ConfigTable config_table;
    switch (config_load_file(config_path, config_table, config_parse_result)) {
        case ConfigLoadResult::Ok: {
            log_debug(fmt::format("loaded configuration from {}", config_path));
        } break;
        case ConfigLoadResult::Invalid: {
            log_error(fmt::format("{}\n\twhile parsing: {}", config_parse_result.error, config_path));
            // Keep the defaults; don't trust anything that was read before the error.
            config_table = ConfigTable{};
        } break;
        case ConfigLoadResult::DoesNotExist: {
            log_info(fmt::format("could not find default config. creating file:\n\t{}", config_path));
            flush_config_to_disk = true;
        } break;
    };

    // clang-format off
    const OptionVector options = {
       { "general.verbose",       ConfigVariableType::Bool,   &program_options.verbose },
       { "general.quiet",         ConfigVariableType::Bool,   &program_options.quiet },
       { "general.backup_suffix", ConfigVariableType::String, &program_options.backup_suffix },
    };
    // clang-format on

    apply_option_vector(config_table, options);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_save(config_root, config_path, config_table);
    }
}
