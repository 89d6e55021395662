#ifndef TYPES_H
#define TYPES_H

#include <cstdint>

typedef uint8_t byte;
typedef uint16_t word;
typedef uint32_t dword;

#endif
