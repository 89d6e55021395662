#include "basic_assembler.h"
#include "bit_format.h"
#include "log.h"

// ── Errors ──

const char* asm_error_kind_name(AsmErrorKind kind) {
    switch (kind) {
        case AsmErrorKind::MalformedLiteral: return "malformed literal";
        case AsmErrorKind::UnresolvedSymbol: return "unresolved symbol";
        case AsmErrorKind::MissingEndDirective: return "missing END directive";
        case AsmErrorKind::AddressOverflow: return "address overflow";
        case AsmErrorKind::DuplicateLabel: return "duplicate label";
        case AsmErrorKind::LocationReused: return "location reused";
    }
    return "error";
}

std::string format_error(const AsmError& error) {
    std::string s = "line " + std::to_string(error.line) + ": " +
                    asm_error_kind_name(error.kind) + ": " + error.message;
    if (!error.tokens.empty()) s += " [" + error.tokens + "]";
    return s;
}

static AsmError make_error(const SourceLine& line, AsmErrorKind kind, const std::string& message) {
    return {line.number, kind, line.text(), message};
}

std::map<std::string, std::string> AsmResult::binary() const {
    std::map<std::string, std::string> out;
    for (const auto& [location, cell] : image) {
        std::string value;
        if (const auto* enc = std::get_if<EncodedWord>(&cell.value)) {
            value = to_binary(enc->value, WORD_BITS);
        } else {
            value = std::get<RawCell>(cell.value).mnemonic;
        }
        out[to_binary(location, ADDRESS_BITS)] = value;
    }
    return out;
}

// ── Assembler ──

BasicAssembler::BasicAssembler(const InstructionSet& isa, const AsmOptions& options)
    : isa_(isa), options_(options) {}

bool BasicAssembler::is_label(const std::string& token) const {
    return !token.empty() && token.back() == options_.label_delimiter;
}

bool BasicAssembler::is_pseudo(const std::string& token) {
    return token == "org" || token == "end" || token == "dec" || token == "hex";
}

bool BasicAssembler::lookup_mri(const std::string& mnemonic, word& opcode, bool& indirect) const {
    if (const std::string* bits = isa_.mri.find(mnemonic)) {
        opcode = static_cast<word>(binary_value(*bits));
        indirect = false;
        return true;
    }
    if (mnemonic.size() > 1 && mnemonic.back() == options_.indirect_suffix) {
        if (const std::string* bits = isa_.mri.find(mnemonic.substr(0, mnemonic.size() - 1))) {
            opcode = static_cast<word>(binary_value(*bits));
            indirect = true;
            return true;
        }
    }
    return false;
}

word BasicAssembler::encode_mri(bool indirect, word opcode, word address) {
    return static_cast<word>((indirect ? 0x8000 : 0) |
                             ((opcode & 0x7) << ADDRESS_BITS) |
                             (address & MAX_ADDRESS));
}

bool BasicAssembler::parse_origin(const SourceLine& line, dword& location,
                                  std::vector<AsmError>& errors) const {
    if (line.tokens.size() < 2) {
        errors.push_back(make_error(line, AsmErrorKind::MalformedLiteral, "ORG: missing address"));
        return false;
    }
    dword value;
    std::string err;
    if (!parse_hex(line.tokens[1], MAX_LITERAL, value, err)) {
        errors.push_back(make_error(line, AsmErrorKind::MalformedLiteral, "ORG: " + err));
        return false;
    }
    if (value > MAX_ADDRESS) {
        errors.push_back(make_error(line, AsmErrorKind::AddressOverflow,
                                    "ORG " + line.tokens[1] + " is beyond the 12-bit address space"));
        return false;
    }
    location = value;
    return true;
}

bool BasicAssembler::pass1(const std::vector<SourceLine>& lines, PassOneResult& out,
                           std::vector<AsmError>& errors) const {
    dword location = 0;
    out = PassOneResult();

    auto store = [&](const SourceLine& line, const CellValue& value) {
        auto it = out.symbols.find(static_cast<word>(location));
        if (it != out.symbols.end()) {
            LOG_WARNING("line " << line.number << ": location " << to_hex_digits(location, 3)
                        << " already written by line " << it->second.line);
        }
        out.symbols[static_cast<word>(location)] = {value, line.number};
    };

    for (const auto& line : lines) {
        if (line.empty()) continue;
        const std::string& first = line.tokens[0];

        if (is_label(first)) {
            std::string label = first.substr(0, first.size() - 1);
            if (label.empty()) {
                errors.push_back(make_error(line, AsmErrorKind::UnresolvedSymbol, "empty label name"));
                return false;
            }
            if (out.labels.count(label)) {
                errors.push_back(make_error(line, AsmErrorKind::DuplicateLabel,
                                            "label '" + label + "' already defined"));
                return false;
            }
            if (location > MAX_ADDRESS) {
                errors.push_back(make_error(line, AsmErrorKind::AddressOverflow,
                                            "label '" + label + "' placed beyond the 12-bit address space"));
                return false;
            }
            out.labels[label] = static_cast<word>(location);

            // A bare label names the next location without occupying one
            if (line.tokens.size() == 1) continue;

            if (line.tokens[1] == "hex") {
                if (line.tokens.size() < 3) {
                    errors.push_back(make_error(line, AsmErrorKind::MalformedLiteral, "HEX: missing value"));
                    return false;
                }
                dword value;
                std::string err;
                if (!parse_hex(line.tokens[2], MAX_WORD, value, err)) {
                    errors.push_back(make_error(line, AsmErrorKind::MalformedLiteral, "HEX: " + err));
                    return false;
                }
                store(line, EncodedWord{static_cast<word>(value)});
            } else {
                store(line, RawCell{line.tokens[1]});
            }
            location++;
            continue;
        }

        if (first == "org") {
            if (!parse_origin(line, location, errors)) return false;
            continue;
        }

        if (first == "end") {
            out.hit_end = true;
            break;
        }

        if (location > MAX_ADDRESS) {
            errors.push_back(make_error(line, AsmErrorKind::AddressOverflow,
                                        "location counter ran past " + to_hex_digits(MAX_ADDRESS, 3)));
            return false;
        }
        store(line, RawCell{first});
        location++;
    }

    LOG_VERBOSE("Pass 1: " << out.symbols.size() << " locations, " << out.labels.size() << " labels");
    return true;
}

// The last line written to a location owns it; earlier lines are dropped
bool BasicAssembler::superseded(const SourceLine& line, dword location,
                                const AddressSymbolTable& image,
                                std::vector<AsmError>& warnings) const {
    auto it = image.find(static_cast<word>(location));
    if (it == image.end() || it->second.line == line.number) return false;
    warnings.push_back(make_error(line, AsmErrorKind::LocationReused,
                                  "location " + to_hex_digits(location, 3) +
                                  " rewritten by line " + std::to_string(it->second.line)));
    LOG_WARNING(format_error(warnings.back()));
    return true;
}

bool BasicAssembler::check_unresolved(const SourceLine& line, const Cell& cell,
                                      std::vector<AsmError>& errors,
                                      std::vector<AsmError>& warnings) const {
    const auto* raw = std::get_if<RawCell>(&cell.value);
    if (!raw) return true;

    word opcode;
    bool indirect;
    if (lookup_mri(raw->mnemonic, opcode, indirect)) {
        // Only unlabeled MRI lines are routed through the encoder
        warnings.push_back(make_error(line, AsmErrorKind::UnresolvedSymbol,
                                      "labeled memory-reference instruction '" + raw->mnemonic +
                                      "' left unencoded"));
        LOG_WARNING(format_error(warnings.back()));
        return true;
    }
    if (is_pseudo(raw->mnemonic)) {
        warnings.push_back(make_error(line, AsmErrorKind::UnresolvedSymbol,
                                      "directive '" + raw->mnemonic + "' has no encoding here, cell kept as text"));
        LOG_WARNING(format_error(warnings.back()));
        return true;
    }
    errors.push_back(make_error(line, AsmErrorKind::UnresolvedSymbol,
                                "unknown mnemonic '" + raw->mnemonic + "'"));
    return false;
}

bool BasicAssembler::pass2(const std::vector<SourceLine>& lines, const PassOneResult& first,
                           AddressSymbolTable& image, bool& hit_end,
                           std::vector<AsmError>& errors, std::vector<AsmError>& warnings) const {
    image = first.symbols;
    hit_end = false;

    // Operand-less instructions are complete words already
    for (auto& [location, cell] : image) {
        const auto* raw = std::get_if<RawCell>(&cell.value);
        if (!raw) continue;
        const std::string mnemonic = raw->mnemonic;
        if (const std::string* bits = isa_.rri.find(mnemonic)) {
            cell.value = EncodedWord{static_cast<word>(binary_value(*bits))};
        }
        if (const std::string* bits = isa_.ioi.find(mnemonic)) {
            cell.value = EncodedWord{static_cast<word>(binary_value(*bits))};
        }
    }

    dword location = 0;
    for (const auto& line : lines) {
        if (line.empty()) continue;
        const std::string& op = line.tokens[0];

        if (is_pseudo(op)) {
            if (op == "org") {
                if (!parse_origin(line, location, errors)) return false;
                continue;
            }
            if (op == "end") {
                hit_end = true;
                break;
            }
            // DEC/HEX without a label: nothing to encode
            auto it = image.find(static_cast<word>(location));
            if (it != image.end() && !superseded(line, location, image, warnings) &&
                !check_unresolved(line, it->second, errors, warnings))
                return false;
            location++;
            continue;
        }

        word opcode;
        bool indirect;
        if (lookup_mri(op, opcode, indirect)) {
            if (line.tokens.size() < 2) {
                errors.push_back(make_error(line, AsmErrorKind::UnresolvedSymbol,
                                            "missing address operand for '" + op + "'"));
                return false;
            }
            const std::string& target = line.tokens[1];
            auto label = first.labels.find(target);
            if (label == first.labels.end()) {
                errors.push_back(make_error(line, AsmErrorKind::UnresolvedSymbol,
                                            "undefined label '" + target + "'"));
                return false;
            }
            word w = encode_mri(indirect, opcode, label->second);
            LOG_DEBUG(to_binary(location, ADDRESS_BITS) << " " << op << " " << target
                      << " -> " << to_binary(w, WORD_BITS));
            if (!superseded(line, location, image, warnings))
                image[static_cast<word>(location)] = {EncodedWord{w}, line.number};
            location++;
            continue;
        }

        // Bare labels do not occupy a location in pass 1 either
        if (is_label(op) && line.tokens.size() == 1) continue;

        auto it = image.find(static_cast<word>(location));
        if (it != image.end() && !superseded(line, location, image, warnings) &&
            !check_unresolved(line, it->second, errors, warnings))
            return false;
        location++;
    }

    LOG_VERBOSE("Pass 2: " << image.size() << " words" << (hit_end ? "" : " (no END)"));
    return true;
}

AsmResult BasicAssembler::assemble(const std::vector<SourceLine>& lines) const {
    AsmResult result;

    PassOneResult first;
    if (!pass1(lines, first, result.errors)) {
        return result;
    }
    result.labels = first.labels;

    if (!pass2(lines, first, result.image, result.hit_end, result.errors, result.warnings)) {
        result.image.clear();
        return result;
    }

    if (!result.hit_end) {
        int last = lines.empty() ? 0 : lines.back().number;
        AsmError missing{last, AsmErrorKind::MissingEndDirective, "",
                         "input ended without an END directive"};
        if (options_.require_end) {
            result.errors.push_back(missing);
            result.image.clear();
            return result;
        }
        result.warnings.push_back(missing);
        LOG_WARNING(format_error(missing));
    }

    result.success = true;
    return result;
}

AsmResult BasicAssembler::assemble(const std::string& source, char comment_marker) const {
    return assemble(tokenize_source(source, comment_marker));
}
