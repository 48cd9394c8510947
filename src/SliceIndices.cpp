#include "SliceIndices.hpp"
#include "Errors.hpp"
#include <limits>
#include <stdexcept>
#include <string>

size_t normalizeIndex(int64_t index, size_t length) {
    const int64_t n = static_cast<int64_t>(length);
    int64_t resolved = index < 0 ? index + n : index;
    if (resolved < 0 || resolved >= n) {
        throw IndexOutOfRangeError("Index " + std::to_string(index) +
                                   " out of range for " + std::to_string(length) + " lines");
    }
    return static_cast<size_t>(resolved);
}

namespace {

// Clamp one slice bound into [lower, upper].
int64_t adjustBound(std::optional<int64_t> bound, int64_t fallback, int64_t n, int64_t lower, int64_t upper) {
    if (!bound) {
        return fallback;
    }
    int64_t value = *bound;
    if (value < 0) {
        value += n;
        if (value < lower) value = lower;
    } else if (value > upper) {
        value = upper;
    }
    return value;
}

} // namespace

std::vector<size_t> resolveSlice(size_t length,
                                 std::optional<int64_t> start,
                                 std::optional<int64_t> stop,
                                 int64_t step) {
    if (step == 0) {
        throw std::invalid_argument("Slice step cannot be zero");
    }
    // -step must stay representable
    if (step == std::numeric_limits<int64_t>::min()) {
        throw std::invalid_argument("Slice step out of range");
    }
    const int64_t n = static_cast<int64_t>(length);
    // reverse slices may run down to one before index 0
    const int64_t lower = step > 0 ? 0 : -1;
    const int64_t upper = step > 0 ? n : n - 1;

    int64_t first = adjustBound(start, step > 0 ? lower : upper, n, lower, upper);
    int64_t last = adjustBound(stop, step > 0 ? upper : lower, n, lower, upper);

    std::vector<size_t> indices;
    if (step > 0) {
        if (first < last) indices.reserve(static_cast<size_t>((last - first - 1) / step + 1));
        for (int64_t i = first; i < last; i += step) {
            indices.push_back(static_cast<size_t>(i));
            if (last - i <= step) break;
        }
    } else {
        if (first > last) indices.reserve(static_cast<size_t>((first - last - 1) / -step + 1));
        for (int64_t i = first; i > last; i += step) {
            indices.push_back(static_cast<size_t>(i));
            if (i - last <= -step) break;
        }
    }
    return indices;
}
