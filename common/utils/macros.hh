#pragma once

#include <cstdint>

#ifndef MAX
#define MAX(a, b) ((a) > (b) ? (a) : (b))
#endif

#ifndef MIN
#define MIN(a, b) ((b) > (a) ? (a) : (b))
#endif

// Number of elements in a statically sized array.
#define ARRAY_LEN(arr) (sizeof(arr) / sizeof((arr)[0]))
