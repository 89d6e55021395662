#pragma once
#include "basic_assembler.h"
#include "listing.h"
#include <map>
#include <string>

struct AsmConfig {
    // [tables]: empty path = built-in table
    std::string mri_table;
    std::string rri_table;
    std::string ioi_table;
    // [syntax]
    char comment_marker = '/';
    char label_delimiter = ',';
    char indirect_suffix = 'i';
    // [assembler]
    bool require_end = false;
    // [output]
    ListingFormat format = ListingFormat::BIN;
    bool print_symbols = false;

    AsmOptions asm_options() const;
};

// Read an INI file ("[section]" headers, "key = value", ';' or '#' comments).
// Unknown keys and bad values are logged and skipped; only a missing file fails.
std::string read_config(const std::string& path, AsmConfig& cfg);
std::string parse_config(const std::string& text, AsmConfig& cfg);

// Set one "section.key" item. Returns an empty string on success.
std::string apply_config_value(AsmConfig& cfg, const std::string& section,
                               const std::string& key, const std::string& value);

// Apply command line overrides (section -> key -> value)
std::string apply_config_overrides(AsmConfig& cfg,
    const std::map<std::string, std::map<std::string, std::string>>& overrides);
