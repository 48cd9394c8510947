#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Strict index normalization: negative values count from the end.
// Throws IndexOutOfRangeError outside [-length, length-1].
size_t normalizeIndex(int64_t index, size_t length);

// Effective index sequence of a list-style slice over `length` elements.
// Omitted bounds default by step direction, negative bounds count from the
// end, and out-of-range bounds are clamped rather than rejected.
// step == 0 throws std::invalid_argument.
std::vector<size_t> resolveSlice(size_t length,
                                 std::optional<int64_t> start,
                                 std::optional<int64_t> stop,
                                 int64_t step = 1);
