#include "bit_format.h"

#include <cctype>
#include <iomanip>
#include <sstream>

std::string to_binary(dword value, int bits) {
    std::string r;
    while (value) {
        r.insert(r.begin(), (value & 1) ? '1' : '0');
        value >>= 1;
    }
    if (static_cast<int>(r.size()) < bits)
        r.insert(0, bits - r.size(), '0');
    return r;
}

std::string to_hex_digits(dword value, int digits) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0') << std::setw(digits) << value;
    return oss.str();
}

static int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool parse_radix(const std::string& text, int radix, dword max,
                        dword& value, std::string& error) {
    if (text.empty()) {
        error = "empty literal";
        return false;
    }
    dword v = 0;
    for (char c : text) {
        int d = digit_value(c);
        if (d < 0 || d >= radix) {
            error = "invalid digit '" + std::string(1, c) + "' in literal '" + text + "'";
            return false;
        }
        v = v * radix + static_cast<dword>(d);
        if (v > max) {
            error = "literal '" + text + "' out of range (max " + std::to_string(max) + ")";
            return false;
        }
    }
    value = v;
    return true;
}

bool parse_hex(const std::string& text, dword max, dword& value, std::string& error) {
    std::string digits = text;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
        digits = digits.substr(2);
    return parse_radix(digits, 16, max, value, error);
}

bool is_binary_string(const std::string& text, int bits) {
    if (static_cast<int>(text.size()) != bits) return false;
    for (char c : text)
        if (c != '0' && c != '1') return false;
    return true;
}

dword binary_value(const std::string& text) {
    dword v = 0;
    for (char c : text) v = (v << 1) | (c == '1' ? 1u : 0u);
    return v;
}
