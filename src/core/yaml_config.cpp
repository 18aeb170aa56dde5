/**
 * YAML Configuration Loader Implementation
 */

#include "yaml_config.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace xkpass {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void trim(std::string& s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(0, 1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.pop_back();
}

bool is_quoted(const std::string& value) {
    return value.length() >= 2 &&
           ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\''));
}

std::string unquote(const std::string& value) {
    return is_quoted(value) ? value.substr(1, value.length() - 2) : value;
}

/**
 * Drop a trailing "# comment". A '#' inside quotes or glued to a value
 * (e.g. "#" as a symbol) is kept.
 */
std::string strip_comment(const std::string& line) {
    char quote = '\0';
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

int parse_int(const std::string& value) {
    size_t consumed = 0;
    int result = std::stoi(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("not an integer: " + value);
    }
    return result;
}

char parse_single_char(const std::string& value, const char* what) {
    if (value.size() != 1) {
        throw std::invalid_argument(std::string(what) + " must be a single character: " + value);
    }
    return value[0];
}

}  // namespace

// -----------------------------------------------------------------------------
// Value parsers
// -----------------------------------------------------------------------------

bool parse_bool(const std::string& value) {
    std::string lower = to_lower(value);
    return (lower == "true" || lower == "yes" || lower == "1" || lower == "on");
}

CharChoice parse_char_choice(const std::string& value) {
    if (is_quoted(value)) {
        std::string inner = unquote(value);
        if (inner.empty()) return CharChoice::none();
        return CharChoice::fixed(parse_single_char(inner, "Character"));
    }

    std::string lower = to_lower(value);
    if (lower == "random" || lower.empty()) return CharChoice::random();
    if (lower == "none") return CharChoice::none();
    return CharChoice::fixed(parse_single_char(value, "Character"));
}

CaseTransform parse_case_transform(const std::string& value) {
    std::string lower = to_lower(value);
    if (lower == "none") return CaseTransform::NONE;
    if (lower == "upper" || lower == "uppercase") return CaseTransform::UPPER;
    if (lower == "lower" || lower == "lowercase") return CaseTransform::LOWER;
    if (lower == "capitalize") return CaseTransform::CAPITALIZE;
    if (lower == "invert") return CaseTransform::INVERT;
    if (lower == "alternate") return CaseTransform::ALTERNATE;
    if (lower == "random") return CaseTransform::RANDOM;
    throw std::invalid_argument("unknown case transform: " + value);
}

PaddingType parse_padding_type(const std::string& value) {
    std::string lower = to_lower(value);
    if (lower == "none") return PaddingType::NONE;
    if (lower == "fixed") return PaddingType::FIXED;
    if (lower == "adaptive") return PaddingType::ADAPTIVE;
    throw std::invalid_argument("unknown padding type: " + value);
}

// -----------------------------------------------------------------------------
// ConfigFile
// -----------------------------------------------------------------------------

std::vector<std::string> ConfigFile::get_config_paths() {
    std::vector<std::string> paths;

    // 1. Current directory
    paths.push_back("./config.yml");
    paths.push_back("./config.yaml");

    // 2. User home directory
    std::string home;
#ifdef _WIN32
    const char* userprofile = std::getenv("USERPROFILE");
    home = userprofile ? userprofile : "";
#else
    const char* home_env = std::getenv("HOME");
    home = home_env ? home_env : "";
#endif
    if (!home.empty()) {
        paths.push_back(home + "/.xkpass/config.yml");
        paths.push_back(home + "/.xkpass/config.yaml");
    }

    return paths;
}

bool ConfigFile::load(const std::string& explicit_path) {
    std::string config_path;

    if (!explicit_path.empty()) {
        if (std::filesystem::exists(explicit_path)) {
            config_path = explicit_path;
        } else {
            std::cerr << "[!] Config file not found: " << explicit_path << "\n";
            return false;
        }
    } else {
        for (const auto& path : get_config_paths()) {
            if (std::filesystem::exists(path)) {
                config_path = path;
                break;
            }
        }
    }

    if (config_path.empty()) {
        return false;  // No config file found (this is OK)
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[!] Failed to open config file: " << config_path << "\n";
        return false;
    }

    load_stream(file, config_path);
    loaded_from = config_path;
    Logger::instance().log_config_loaded(config_path, error_count);
    return true;
}

bool ConfigFile::init_logging() const {
    return Logger::instance().init(log_dir, debug ? Logger::Level::DEBUG : Logger::Level::INFO);
}

int ConfigFile::load_stream(std::istream& in, const std::string& origin) {
    std::string line;
    std::string current_section;
    int line_number = 0;
    int errors = 0;

    while (std::getline(in, line)) {
        line_number++;

        // Trim leading whitespace and count indent
        size_t indent = 0;
        while (indent < line.length() && (line[indent] == ' ' || line[indent] == '\t')) {
            indent++;
        }
        std::string trimmed = line.substr(indent);

        // Skip empty lines, comments and document markers
        if (trimmed.empty() || trimmed[0] == '#' || trimmed.substr(0, 3) == "---") {
            continue;
        }

        trimmed = strip_comment(trimmed);
        trim(trimmed);
        if (trimmed.empty()) continue;

        // Parse key: value. A quoted key may itself be ':'
        size_t colon_pos;
        if ((trimmed[0] == '"' || trimmed[0] == '\'') && trimmed.size() > 3 &&
            trimmed[2] == trimmed[0] && trimmed[3] == ':') {
            colon_pos = 3;
        } else {
            colon_pos = trimmed.find(':');
        }
        if (colon_pos == std::string::npos) continue;

        std::string key = trimmed.substr(0, colon_pos);
        std::string value = (colon_pos + 1 < trimmed.length()) ? trimmed.substr(colon_pos + 1) : "";
        trim(key);
        trim(value);

        // Section header (no value at top level)
        if (value.empty() && indent == 0) {
            current_section = key;
            continue;
        }

        try {
            parse_value(current_section, key, value);
        } catch (const std::exception& e) {
            std::cerr << "[!] Config parse error at " << origin << ":" << line_number
                      << ": " << e.what() << "\n";
            errors++;
        }
    }

    error_count += errors;
    return errors;
}

void ConfigFile::parse_value(const std::string& section, const std::string& key, const std::string& raw) {
    const std::string value = unquote(raw);

    if (section == "words") {
        if (key == "list") generator.set_word_list_path(value);
        else if (key == "count") generator.set_word_count(parse_int(value));
        else if (key == "min_length") generator.set_min_word_length(parse_int(value));
        else if (key == "max_length") generator.set_max_word_length(parse_int(value));
        else throw std::invalid_argument("unknown key words." + key);
    }
    else if (section == "separator") {
        if (key == "character") generator.set_separator_character(parse_char_choice(raw));
        else if (key == "alphabet") generator.set_separator_alphabet(std::string_view(value));
        else throw std::invalid_argument("unknown key separator." + key);
    }
    else if (section == "symbols") {
        if (key == "alphabet") generator.set_symbol_alphabet(std::string_view(value));
        else throw std::invalid_argument("unknown key symbols." + key);
    }
    else if (section == "digits") {
        if (key == "before") generator.set_padding_digits_before(parse_int(value));
        else if (key == "after") generator.set_padding_digits_after(parse_int(value));
        else throw std::invalid_argument("unknown key digits." + key);
    }
    else if (section == "padding") {
        if (key == "type") generator.set_padding_type(parse_padding_type(value));
        else if (key == "character") generator.set_padding_character(parse_char_choice(raw));
        else if (key == "before") generator.set_padding_characters_before(parse_int(value));
        else if (key == "after") generator.set_padding_characters_after(parse_int(value));
        else if (key == "pad_to_length") generator.set_pad_to_length(parse_int(value));
        else throw std::invalid_argument("unknown key padding." + key);
    }
    else if (section == "case") {
        if (key == "transform") generator.set_case_transform(parse_case_transform(value));
        else throw std::invalid_argument("unknown key case." + key);
    }
    else if (section == "substitutions") {
        char from = parse_single_char(unquote(key), "Substitution key");
        char to = parse_single_char(value, "Substitution value");
        generator.character_substitutions().set(from, to);
    }
    else if (section == "settings") {
        if (key == "debug") debug = parse_bool(value);
        else throw std::invalid_argument("unknown key settings." + key);
    }
    else if (section == "paths") {
        if (key == "resource_dir") resource_dir = value;
        else if (key == "log_dir") log_dir = value;
        else throw std::invalid_argument("unknown key paths." + key);
    }
    else {
        throw std::invalid_argument("unknown section: " + section);
    }
}

}  // namespace xkpass
