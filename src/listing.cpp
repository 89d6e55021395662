#include "listing.h"
#include "bit_format.h"
#include "log.h"

#include <fstream>

bool parse_listing_format(const std::string& name, ListingFormat& format) {
    if (name == "bin") {
        format = ListingFormat::BIN;
        return true;
    }
    if (name == "hex") {
        format = ListingFormat::HEX;
        return true;
    }
    return false;
}

const char* listing_format_name(ListingFormat format) {
    return format == ListingFormat::HEX ? "hex" : "bin";
}

static std::string format_location(word location, ListingFormat format) {
    return format == ListingFormat::HEX ? to_hex_digits(location, 3)
                                        : to_binary(location, ADDRESS_BITS);
}

void write_listing(std::ostream& os, const AddressSymbolTable& image, ListingFormat format) {
    for (const auto& [location, cell] : image) {
        os << format_location(location, format) << " ";
        if (const auto* enc = std::get_if<EncodedWord>(&cell.value)) {
            os << (format == ListingFormat::HEX ? to_hex_digits(enc->value, 4)
                                                : to_binary(enc->value, WORD_BITS));
        } else {
            os << std::get<RawCell>(cell.value).mnemonic;
        }
        os << "\n";
    }
}

void write_symbols(std::ostream& os, const LabelAddressTable& labels, ListingFormat format) {
    for (const auto& [name, location] : labels) {
        os << name << " " << format_location(location, format) << "\n";
    }
}

std::string save_listing(const std::string& path, const AsmResult& result,
                         ListingFormat format, bool with_symbols) {
    std::ofstream f(path, std::ios_base::trunc);
    if (!f.is_open()) return "cannot open output file: " + path;

    write_listing(f, result.image, format);
    if (with_symbols) {
        f << "; labels\n";
        write_symbols(f, result.labels, format);
    }
    if (!f.good()) return "write error: " + path;
    LOG_VERBOSE("Wrote " << result.image.size() << " words to " << path);
    return "";
}
