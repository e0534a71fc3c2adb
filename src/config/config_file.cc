#include "config_file.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <filesystem>
#include <string_view>
#include <utility>

using namespace minpatch;

namespace {

std::string_view
trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool
is_identifier(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

// Drop a '#' comment, unless the '#' is inside a quoted string.
std::string_view
strip_comment(std::string_view line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

bool
parse_value(std::string_view text, ConfigValue& value) {
    if (text.size() >= 2 && (text.front() == '\'' || text.front() == '"')) {
        if (text.back() != text.front()) {
            return false;
        }
        auto inner = text.substr(1, text.size() - 2);
        if (inner.find(text.front()) != std::string_view::npos) {
            return false;
        }
        value = ConfigValue::from_string(std::string(inner));
        return true;
    }

    if (text == "true" || text == "false") {
        value = ConfigValue::from_bool(text == "true");
        return true;
    }

    int64_t number = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (!text.empty() && ec == std::errc() && ptr == text.data() + text.size()) {
        value = ConfigValue::from_int(number);
        return true;
    }

    return false;
}

std::string
serialize_value(const ConfigValue& value) {
    switch (value.type) {
        case ConfigValue::Type::Bool:
            return value.as_bool ? "true" : "false";
        case ConfigValue::Type::Int:
            return fmt::format("{}", value.as_int);
        case ConfigValue::Type::String: {
            char quote = value.as_string.find('\'') == std::string::npos ? '\'' : '"';
            return fmt::format("{}{}{}", quote, value.as_string, quote);
        }
    }
    return "";
}

}  // namespace

ConfigValue
ConfigValue::from_bool(bool value) {
    ConfigValue v;
    v.type = Type::Bool;
    v.as_bool = value;
    return v;
}

ConfigValue
ConfigValue::from_int(int64_t value) {
    ConfigValue v;
    v.type = Type::Int;
    v.as_int = value;
    return v;
}

ConfigValue
ConfigValue::from_string(std::string value) {
    ConfigValue v;
    v.type = Type::String;
    v.as_string = std::move(value);
    return v;
}

std::optional<ConfigValue>
ConfigTable::lookup_value_by_path(const std::string& path) const {
    auto dot = path.find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }

    auto section = sections.find(path.substr(0, dot));
    if (section == sections.end()) {
        return std::nullopt;
    }

    auto entry = section->second.find(path.substr(dot + 1));
    if (entry == section->second.end()) {
        return std::nullopt;
    }
    return entry->second;
}

bool
ConfigTable::set_value_at(const std::string& path, ConfigValue value) {
    auto dot = path.find('.');
    if (dot == std::string::npos) {
        return false;
    }
    if (value.type == ConfigValue::Type::String && value.as_string.find('\'') != std::string::npos &&
        value.as_string.find('"') != std::string::npos) {
        return false;
    }
    sections[path.substr(0, dot)][path.substr(dot + 1)] = std::move(value);
    return true;
}

bool
minpatch::cfg_parse(const std::string& input_data, ParseResult& result, ConfigTable& table) {
    auto set_error = [&result](int line_number, const std::string& message) {
        result.kind = ParseErrorKind::Parsing;
        result.error = fmt::format("line {}: {}", line_number, message);
        return false;
    };

    std::string section;
    int line_number = 0;

    LineCursor cursor{input_data};
    std::string_view raw_line;
    while (cursor.next(&raw_line)) {
        line_number++;
        auto line = trim(strip_comment(raw_line));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                return set_error(line_number, "expected ']' after section name");
            }
            auto name = trim(line.substr(1, line.size() - 2));
            if (!is_identifier(name)) {
                return set_error(line_number, fmt::format("invalid section name '{}'", name));
            }
            section = std::string(name);
            table.sections[section];
            continue;
        }

        auto equals = line.find('=');
        if (equals == std::string_view::npos) {
            return set_error(line_number, fmt::format("expected 'key = value', got '{}'", line));
        }

        auto key = trim(line.substr(0, equals));
        auto value_text = trim(line.substr(equals + 1));
        if (!is_identifier(key)) {
            return set_error(line_number, fmt::format("invalid key '{}'", key));
        }
        if (section.empty()) {
            return set_error(line_number, fmt::format("key '{}' is not inside a [section]", key));
        }

        ConfigValue value;
        if (!parse_value(value_text, value)) {
            return set_error(line_number, fmt::format("invalid value '{}' for key '{}'", value_text, key));
        }
        table.sections[section][std::string(key)] = std::move(value);
    }

    result.kind = ParseErrorKind::None;
    result.error.clear();
    return true;
}

bool
minpatch::cfg_load_file(const std::string& file_path, ParseResult& result, ConfigTable& table) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        result.kind = ParseErrorKind::File;
        result.error = "File does not exist";
        return false;
    }

    if (!std::filesystem::is_regular_file(file_path, ec)) {
        result.kind = ParseErrorKind::File;
        result.error = "File is not a regular file";
        return false;
    }

    std::string contents;
    if (!readfile(file_path, contents)) {
        result.kind = ParseErrorKind::File;
        result.error = "Failed to open file for reading";
        return false;
    }

    return cfg_parse(contents, result, table);
}

std::string
minpatch::cfg_serialize(const ConfigTable& table) {
    std::string s;
    for (const auto& [section, entries] : table.sections) {
        if (!s.empty()) {
            s += "\n";
        }
        s += fmt::format("[{}]\n", section);
        for (const auto& [key, value] : entries) {
            s += fmt::format("{} = {}\n", key, serialize_value(value));
        }
    }
    return s;
}
