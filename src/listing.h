#ifndef LISTING_H
#define LISTING_H

#include "basic_assembler.h"
#include <ostream>
#include <string>

enum class ListingFormat {
    BIN,    // 000100000000 0111100000000000
    HEX,    // 100 7800
};

// "bin"/"hex" -> format; returns false for anything else
bool parse_listing_format(const std::string& name, ListingFormat& format);
const char* listing_format_name(ListingFormat format);

// One "<location> <word>" line per assembled location, ascending
void write_listing(std::ostream& os, const AddressSymbolTable& image, ListingFormat format);

// "<label> <location>" lines sorted by label
void write_symbols(std::ostream& os, const LabelAddressTable& labels, ListingFormat format);

// Write the listing (and optionally the label table) to `path`.
// Returns an empty string on success, an error message otherwise.
std::string save_listing(const std::string& path, const AsmResult& result,
                         ListingFormat format, bool with_symbols);

#endif
