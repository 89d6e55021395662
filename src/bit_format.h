#ifndef BIT_FORMAT_H
#define BIT_FORMAT_H

#include "types.h"
#include <string>

// Word layout of the Basic Computer: I(1) | opcode(3) | address(12)
constexpr int ADDRESS_BITS = 12;
constexpr int OPCODE_BITS = 3;
constexpr int WORD_BITS = 16;
constexpr dword MAX_ADDRESS = (1u << ADDRESS_BITS) - 1;
constexpr dword MAX_WORD = (1u << WORD_BITS) - 1;
// Widest literal the parsers accept, so that range errors can be told apart from bad digits
constexpr dword MAX_LITERAL = 0x0FFFFFFF;

// Zero-padded binary rendering, e.g. to_binary(5, 12) == "000000000101".
// Values wider than `bits` are not truncated.
std::string to_binary(dword value, int bits);

// Uppercase zero-padded hex rendering, e.g. to_hex_digits(0x100, 3) == "100"
std::string to_hex_digits(dword value, int digits);

// Hex literal parser: returns false and fill `error` on bad digits or when the
// value exceeds `max`. An optional 0x prefix is accepted.
bool parse_hex(const std::string& text, dword max, dword& value, std::string& error);

// True if `text` is exactly `bits` characters of '0'/'1'
bool is_binary_string(const std::string& text, int bits);

// Value of a binary string already checked by is_binary_string()
dword binary_value(const std::string& text);

#endif
