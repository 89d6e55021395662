#include "isa_table.h"
#include "bit_format.h"
#include "stringutils.h"
#include "log.h"

#include <fstream>
#include <sstream>

const char* table_kind_name(TableKind kind) {
    switch (kind) {
        case TableKind::MRI: return "MRI";
        case TableKind::RRI: return "RRI";
        case TableKind::IOI: return "IOI";
    }
    return "?";
}

int table_kind_width(TableKind kind) {
    return kind == TableKind::MRI ? OPCODE_BITS : WORD_BITS;
}

std::string InstructionTable::add(const std::string& mnemonic, const std::string& encoding) {
    if (mnemonic.empty()) return "empty mnemonic";
    if (!is_binary_string(encoding, width())) {
        return std::string(table_kind_name(kind_)) + " encoding for '" + mnemonic +
               "' must be " + std::to_string(width()) + " binary digits, got '" + encoding + "'";
    }
    std::string key = stringutils::lower(mnemonic);
    if (entries_.count(key)) {
        LOG_WARNING(table_kind_name(kind_) << " mnemonic '" << key << "' redefined");
    }
    entries_[key] = encoding;
    return "";
}

const std::string* InstructionTable::find(const std::string& mnemonic) const {
    auto it = entries_.find(mnemonic);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

std::string InstructionTable::parse(const std::string& text, const std::string& origin,
                                    InstructionTable& table) {
    std::istringstream stream(text);
    std::string line;
    int number = 0;
    while (std::getline(stream, line)) {
        number++;
        auto fields = stringutils::split_whitespace(stringutils::lower(line));
        if (fields.empty() || fields[0][0] == '#') continue;
        if (fields.size() != 2) {
            return origin + ":" + std::to_string(number) +
                   ": expected '<mnemonic> <binary>', got '" + stringutils::trim_whitespace(line) + "'";
        }
        auto err = table.add(fields[0], fields[1]);
        if (!err.empty()) return origin + ":" + std::to_string(number) + ": " + err;
    }
    return "";
}

std::string InstructionTable::load(const std::string& path, InstructionTable& table) {
    std::ifstream f(path);
    if (!f.is_open()) return "cannot open instruction table: " + path;
    std::ostringstream ss;
    ss << f.rdbuf();
    auto err = parse(ss.str(), path, table);
    if (!err.empty()) return err;
    LOG_VERBOSE("Loaded " << table.size() << " " << table_kind_name(table.kind())
                << " instructions from " << path);
    return "";
}

// ── Built-in tables ──

struct BuiltinEntry {
    const char* mnemonic;
    const char* encoding;
};

static const BuiltinEntry builtin_mri[] = {
    {"and", "000"}, {"add", "001"}, {"lda", "010"}, {"sta", "011"},
    {"bun", "100"}, {"bsa", "101"}, {"isz", "110"},
};

static const BuiltinEntry builtin_rri[] = {
    {"cla", "0111100000000000"}, {"cle", "0111010000000000"},
    {"cma", "0111001000000000"}, {"cme", "0111000100000000"},
    {"cir", "0111000010000000"}, {"cil", "0111000001000000"},
    {"inc", "0111000000100000"}, {"spa", "0111000000010000"},
    {"sna", "0111000000001000"}, {"sza", "0111000000000100"},
    {"sze", "0111000000000010"}, {"hlt", "0111000000000001"},
};

static const BuiltinEntry builtin_ioi[] = {
    {"inp", "1111100000000000"}, {"out", "1111010000000000"},
    {"ski", "1111001000000000"}, {"sko", "1111000100000000"},
    {"ion", "1111000010000000"}, {"iof", "1111000001000000"},
};

template <size_t N>
static void fill_table(InstructionTable& table, const BuiltinEntry (&entries)[N]) {
    for (const auto& e : entries) table.add(e.mnemonic, e.encoding);
}

InstructionSet builtin_instruction_set() {
    InstructionSet set;
    fill_table(set.mri, builtin_mri);
    fill_table(set.rri, builtin_rri);
    fill_table(set.ioi, builtin_ioi);
    return set;
}

std::string load_instruction_set(const std::string& mri_path,
                                 const std::string& rri_path,
                                 const std::string& ioi_path,
                                 InstructionSet& set) {
    InstructionSet builtin = builtin_instruction_set();
    InstructionSet loaded;
    const std::pair<const std::string*, InstructionTable*> sources[] = {
        {&mri_path, &loaded.mri}, {&rri_path, &loaded.rri}, {&ioi_path, &loaded.ioi},
    };
    const InstructionTable* defaults[] = {&builtin.mri, &builtin.rri, &builtin.ioi};

    for (int i = 0; i < 3; i++) {
        const std::string& path = *sources[i].first;
        InstructionTable& table = *sources[i].second;
        if (path.empty()) {
            table = *defaults[i];
            continue;
        }
        auto err = InstructionTable::load(path, table);
        if (!err.empty()) return err;
    }
    set = loaded;
    return "";
}
