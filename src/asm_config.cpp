#include "asm_config.h"
#include "stringutils.h"
#include "log.h"
#include <fstream>
#include <sstream>

AsmOptions AsmConfig::asm_options() const {
    AsmOptions o;
    o.label_delimiter = label_delimiter;
    o.indirect_suffix = indirect_suffix;
    o.require_end = require_end;
    return o;
}

static std::string parse_char(const std::string& value, char& out) {
    if (value.size() != 1) return "expected a single character, got '" + value + "'";
    out = value[0];
    return "";
}

static std::string parse_flag(const std::string& value, bool& out) {
    if (value == "1" || value == "true" || value == "yes") { out = true; return ""; }
    if (value == "0" || value == "false" || value == "no") { out = false; return ""; }
    return "expected 0 or 1, got '" + value + "'";
}

std::string apply_config_value(AsmConfig& cfg, const std::string& section,
                               const std::string& key, const std::string& value) {
    if (section == "tables") {
        if (key == "mri") { cfg.mri_table = value; return ""; }
        if (key == "rri") { cfg.rri_table = value; return ""; }
        if (key == "ioi") { cfg.ioi_table = value; return ""; }
    } else if (section == "syntax") {
        if (key == "comment_marker") return parse_char(value, cfg.comment_marker);
        if (key == "label_delimiter") return parse_char(value, cfg.label_delimiter);
        if (key == "indirect_suffix") return parse_char(value, cfg.indirect_suffix);
    } else if (section == "assembler") {
        if (key == "require_end") return parse_flag(value, cfg.require_end);
    } else if (section == "output") {
        if (key == "format") {
            if (!parse_listing_format(value, cfg.format))
                return "unknown output format '" + value + "'";
            return "";
        }
        if (key == "symbols") return parse_flag(value, cfg.print_symbols);
    }
    return "unknown setting " + section + "." + key;
}

std::string apply_config_overrides(AsmConfig& cfg,
    const std::map<std::string, std::map<std::string, std::string>>& overrides) {
    for (const auto& [section, items] : overrides) {
        for (const auto& [key, value] : items) {
            auto err = apply_config_value(cfg, section, key, value);
            if (!err.empty()) return err;
        }
    }
    return "";
}

std::string parse_config(const std::string& text, AsmConfig& cfg) {
    std::istringstream stream(text);
    std::string line;
    std::string section;
    int number = 0;
    while (std::getline(stream, line)) {
        number++;
        line = stringutils::trim_whitespace(line);
        if (line.empty() || line[0] == ';' || line[0] == '#') continue;

        if (line[0] == '[') {
            auto close = line.find(']');
            if (close == std::string::npos) {
                LOG_WARNING("config line " << number << ": unterminated section header");
                continue;
            }
            section = stringutils::lower(stringutils::trim_whitespace(line.substr(1, close - 1)));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = stringutils::lower(stringutils::trim_whitespace(line.substr(0, eq)));
        std::string value = line.substr(eq + 1);
        // Strip inline comments, except when the value is the comment character itself
        auto comment = value.find(';', value.find_first_not_of(" \t") + 1);
        if (comment != std::string::npos) value = value.substr(0, comment);
        value = stringutils::trim_whitespace(value);

        if (value.empty()) continue;

        auto err = apply_config_value(cfg, section, key, value);
        if (!err.empty()) {
            LOG_WARNING("config line " << number << ": " << err);
        }
    }
    return "";
}

std::string read_config(const std::string& path, AsmConfig& cfg) {
    std::ifstream f(path);
    if (!f.is_open()) return "cannot open config file: " + path;
    std::ostringstream ss;
    ss << f.rdbuf();
    LOG_VERBOSE("Reading configuration from " << path);
    return parse_config(ss.str(), cfg);
}
