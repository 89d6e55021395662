#ifndef ISA_TABLE_H
#define ISA_TABLE_H

#include <map>
#include <string>

// The three instruction classes of the Basic Computer
enum class TableKind {
    MRI,    // memory-reference: 3-bit opcode, combined with mode bit and address
    RRI,    // register-reference: complete 16-bit word
    IOI,    // input/output: complete 16-bit word
};

const char* table_kind_name(TableKind kind);

// Encoding width in bits for a table kind (3 for MRI, 16 otherwise)
int table_kind_width(TableKind kind);

// Mnemonic -> binary opcode string of a fixed width.
class InstructionTable {
public:
    InstructionTable() = default;
    explicit InstructionTable(TableKind kind) : kind_(kind) {}

    TableKind kind() const { return kind_; }
    int width() const { return table_kind_width(kind_); }

    // Returns an empty string on success, an error message otherwise
    std::string add(const std::string& mnemonic, const std::string& encoding);

    // nullptr when the mnemonic is not in the table
    const std::string* find(const std::string& mnemonic) const;
    bool contains(const std::string& mnemonic) const { return find(mnemonic) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::map<std::string, std::string>& entries() const { return entries_; }

    // Load "<mnemonic> <binary>" lines from a text file into `table`.
    // Blank lines and '#' comment lines are ignored.
    static std::string load(const std::string& path, InstructionTable& table);
    static std::string parse(const std::string& text, const std::string& origin,
                             InstructionTable& table);

private:
    TableKind kind_ = TableKind::MRI;
    std::map<std::string, std::string> entries_;
};

struct InstructionSet {
    InstructionTable mri{TableKind::MRI};
    InstructionTable rri{TableKind::RRI};
    InstructionTable ioi{TableKind::IOI};
};

// Standard Basic Computer tables (AND..ISZ, CLA..HLT, INP..IOF)
InstructionSet builtin_instruction_set();

// Load the three tables. An empty path keeps the built-in table of that kind.
std::string load_instruction_set(const std::string& mri_path,
                                 const std::string& rri_path,
                                 const std::string& ioi_path,
                                 InstructionSet& set);

#endif
