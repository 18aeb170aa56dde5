/**
 * yaml_config.hpp - Simple YAML configuration loader for xkpass
 *
 * Parses a subset of YAML (key: value pairs grouped in sections) without
 * external dependencies. Values are applied through the validating
 * GeneratorConfig setters; a rejected value is reported with its line number
 * and the previous setting is kept.
 *
 *   words:
 *     list: ?en.gz
 *     count: 4
 *     min_length: 4
 *     max_length: 8
 *   separator:
 *     character: random      # random | none | single character
 *     alphabet: "-_."
 *   symbols:
 *     alphabet: "!@$%^&*-_+=:|~?"
 *   digits:
 *     before: 2
 *     after: 2
 *   padding:
 *     type: fixed            # none | fixed | adaptive
 *     character: random
 *     before: 2
 *     after: 2
 *     pad_to_length: 0
 *   case:
 *     transform: capitalize  # none | upper | lower | capitalize | invert | alternate | random
 *   substitutions:
 *     a: "@"
 *     o: "0"
 *   settings:
 *     debug: false           # log at DEBUG instead of INFO
 *   paths:
 *     resource_dir: /usr/share/xkpass
 *     log_dir: /var/log/xkpass  # empty means ~/.xkpass
 */

#pragma once

#include "config.hpp"

#include <istream>
#include <string>
#include <vector>

namespace xkpass {

/**
 * Application configuration loaded from config.yml
 */
struct ConfigFile {
    GeneratorConfig generator;

    // Settings
    bool debug = false;

    // Paths
    std::string resource_dir;   // Empty means WordSourceFactory::default_resource_dir()
    std::string log_dir;        // Empty means ~/.xkpass

    // Path the configuration was read from, empty if none was found
    std::string loaded_from;
    int error_count = 0;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths();

    /**
     * Load configuration from YAML file.
     * Returns true if a config file was found and loaded.
     */
    bool load(const std::string& explicit_path = "");

    /**
     * Parse configuration from an open stream.
     * Returns the number of lines that could not be applied.
     */
    int load_stream(std::istream& in, const std::string& origin = "<stream>");

    /**
     * Start the file logger in log_dir, at DEBUG level when debug is set.
     * Returns false if the log file could not be opened.
     */
    bool init_logging() const;

private:
    void parse_value(const std::string& section, const std::string& key, const std::string& value);
};

// Value parsers shared with tests
bool parse_bool(const std::string& value);
CharChoice parse_char_choice(const std::string& value);
CaseTransform parse_case_transform(const std::string& value);
PaddingType parse_padding_type(const std::string& value);

}  // namespace xkpass
