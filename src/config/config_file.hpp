#pragma once

/*
    Reader and writer for the configuration file format:

        # comment
        [section]
        key = value      # bool, int or 'quoted string'

    Keys are addressed by path, "section.key".
*/

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace minpatch {

struct ConfigValue {
    enum class Type {
        Bool,
        Int,
        String,
    };

    Type type = Type::String;
    bool as_bool = false;
    int64_t as_int = 0;
    std::string as_string;

    static ConfigValue
    from_bool(bool value);

    static ConfigValue
    from_int(int64_t value);

    static ConfigValue
    from_string(std::string value);
};

// Section name -> key -> value, both sorted by name.
struct ConfigTable {
    std::map<std::string, std::map<std::string, ConfigValue>> sections;

    std::optional<ConfigValue>
    lookup_value_by_path(const std::string& path) const;

    // Fails for a path without a section, or a string that can't be quoted
    // (it holds both ' and ").
    bool
    set_value_at(const std::string& path, ConfigValue value);
};

enum class ParseErrorKind {
    None,
    File,
    Parsing,
};

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }
};

bool
cfg_parse(const std::string& input_data, ParseResult& result, ConfigTable& table);

bool
cfg_load_file(const std::string& file_path, ParseResult& result, ConfigTable& table);

std::string
cfg_serialize(const ConfigTable& table);

}  // namespace minpatch
