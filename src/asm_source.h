#ifndef ASM_SOURCE_H
#define ASM_SOURCE_H

#include <string>
#include <vector>

// One source line, lowercased and split on whitespace, comment removed.
// Lines that end up empty are kept so that `number` always matches the file.
struct SourceLine {
    int number;                       // 1-based source line number
    std::vector<std::string> tokens;

    bool empty() const { return tokens.empty(); }
    std::string text() const;         // tokens joined by a single space
};

// Split `source` into token lines. A token starting with `comment_marker`
// and everything after it on the same line is dropped.
std::vector<SourceLine> tokenize_source(const std::string& source, char comment_marker = '/');

// Remove the comment part of an already tokenized line
void strip_comment(std::vector<std::string>& tokens, char comment_marker);

// Read an assembly file into `source`. Only .asm and .S files are accepted.
// Returns an empty string on success, an error message otherwise.
std::string read_source_file(const std::string& path, std::string& source);

#endif
