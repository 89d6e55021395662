#include "asm_source.h"
#include "stringutils.h"
#include "log.h"

#include <fstream>
#include <sstream>

std::string SourceLine::text() const {
    return stringutils::join(tokens, " ");
}

void strip_comment(std::vector<std::string>& tokens, char comment_marker) {
    for (size_t i = 0; i < tokens.size(); i++) {
        if (!tokens[i].empty() && tokens[i][0] == comment_marker) {
            tokens.erase(tokens.begin() + i, tokens.end());
            return;
        }
    }
}

std::vector<SourceLine> tokenize_source(const std::string& source, char comment_marker) {
    std::vector<SourceLine> lines;
    std::istringstream stream(source);
    std::string raw;
    int number = 0;
    while (std::getline(stream, raw)) {
        number++;
        SourceLine line;
        line.number = number;
        line.tokens = stringutils::split_whitespace(stringutils::lower(raw));
        strip_comment(line.tokens, comment_marker);
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string read_source_file(const std::string& path, std::string& source) {
    if (!stringutils::ends_with(path, ".asm") && !stringutils::ends_with(path, ".S")) {
        return "file provided does not end with .asm or .S: " + path;
    }
    std::ifstream f(path);
    if (!f.is_open()) return "cannot open source file: " + path;

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return "read error: " + path;
    source = ss.str();
    LOG_VERBOSE("Read " << source.size() << " bytes from " << path);
    return "";
}
