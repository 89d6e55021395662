#ifndef BASIC_ASSEMBLER_H
#define BASIC_ASSEMBLER_H

#include "types.h"
#include "asm_source.h"
#include "isa_table.h"
#include <map>
#include <string>
#include <variant>
#include <vector>

enum class AsmErrorKind {
    MalformedLiteral,       // bad hex text where a literal was required
    UnresolvedSymbol,       // unknown mnemonic or undefined label
    MissingEndDirective,    // input exhausted without END
    AddressOverflow,        // location or ORG operand beyond 12 bits
    DuplicateLabel,         // label defined twice
    LocationReused,         // warning: a later ORG region rewrote a location
};

const char* asm_error_kind_name(AsmErrorKind kind);

struct AsmError {
    int line;               // 1-based source line number (0 if not tied to a line)
    AsmErrorKind kind;
    std::string tokens;     // raw tokens of the offending line
    std::string message;
};

// "line N: <kind>: <message> [tokens]"
std::string format_error(const AsmError& error);

// A cell of the address symbol table is either still a mnemonic
// waiting for pass 2, or a finished 16-bit word.
struct RawCell {
    std::string mnemonic;
    bool operator==(const RawCell& o) const { return mnemonic == o.mnemonic; }
};

struct EncodedWord {
    word value;
    bool operator==(const EncodedWord& o) const { return value == o.value; }
};

using CellValue = std::variant<RawCell, EncodedWord>;

struct Cell {
    CellValue value;
    int line;               // source line that wrote the cell
};

using AddressSymbolTable = std::map<word, Cell>;
using LabelAddressTable = std::map<std::string, word>;

// Snapshot produced by pass 1
struct PassOneResult {
    AddressSymbolTable symbols;
    LabelAddressTable labels;
    bool hit_end = false;
};

struct AsmOptions {
    char label_delimiter = ',';
    char indirect_suffix = 'i';
    bool require_end = false;   // missing END is an error instead of a warning
};

struct AsmResult {
    bool success = false;
    std::vector<AsmError> errors;       // assembly stops at the first one
    std::vector<AsmError> warnings;
    AddressSymbolTable image;           // final location -> cell mapping
    LabelAddressTable labels;
    bool hit_end = false;

    // External form: 12-bit binary location -> 16-bit binary word.
    // Cells left unresolved keep their mnemonic text.
    std::map<std::string, std::string> binary() const;
};

class BasicAssembler {
public:
    explicit BasicAssembler(const InstructionSet& isa, const AsmOptions& options = AsmOptions());

    // Run both passes over already tokenized lines
    AsmResult assemble(const std::vector<SourceLine>& lines) const;

    // Tokenize `source` and assemble it
    AsmResult assemble(const std::string& source, char comment_marker = '/') const;

    // Pass 1: labels and provisional cells. Returns false on the first error.
    bool pass1(const std::vector<SourceLine>& lines, PassOneResult& out,
               std::vector<AsmError>& errors) const;

    // Pass 2: encode a copy of the pass 1 symbol table into `image`.
    bool pass2(const std::vector<SourceLine>& lines, const PassOneResult& first,
               AddressSymbolTable& image, bool& hit_end,
               std::vector<AsmError>& errors, std::vector<AsmError>& warnings) const;

    // Public for testing
    bool is_label(const std::string& token) const;
    static bool is_pseudo(const std::string& token);
    // Finds `mnemonic` in the MRI table, directly or as <mnemonic><indirect suffix>
    bool lookup_mri(const std::string& mnemonic, word& opcode, bool& indirect) const;
    // Word for an MRI: I | opcode | address
    static word encode_mri(bool indirect, word opcode, word address);

private:
    bool parse_origin(const SourceLine& line, dword& location,
                      std::vector<AsmError>& errors) const;
    bool superseded(const SourceLine& line, dword location, const AddressSymbolTable& image,
                    std::vector<AsmError>& warnings) const;
    bool check_unresolved(const SourceLine& line, const Cell& cell,
                          std::vector<AsmError>& errors,
                          std::vector<AsmError>& warnings) const;

    InstructionSet isa_;
    AsmOptions options_;
};

#endif // BASIC_ASSEMBLER_H
