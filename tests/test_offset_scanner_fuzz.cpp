#include <iostream>
#include <string>
#include <vector>
#include <random>
#include "../src/OffsetScanner.hpp"
#include "TestUtils.hpp"

// Reference: split on '\n' character by character.
static std::vector<uint64_t> reference_offsets(const std::string& s) {
    std::vector<uint64_t> offsets;
    bool at_line_start = true;
    for (size_t pos = 0; pos < s.size(); ++pos) {
        if (at_line_start) {
            offsets.push_back(pos);
            at_line_start = false;
        }
        if (s[pos] == '\n') {
            at_line_start = true;
        }
    }
    return offsets;
}

// Reassemble every line from the offsets; must equal the input minus terminators.
static bool lines_cover_input(const std::string& s, const std::vector<uint64_t>& offsets) {
    std::string rebuilt;
    for (size_t i = 0; i < offsets.size(); ++i) {
        size_t end = (i + 1 < offsets.size()) ? offsets[i + 1] : s.size();
        rebuilt += s.substr(offsets[i], end - offsets[i]);
    }
    return rebuilt == s;
}

int main() {
    try {
        // Repeatable RNG
        std::mt19937 rng(123456);
        std::uniform_int_distribution<int> len_d(0, 2048);
        std::uniform_int_distribution<int> char_d(0, 99);

        for (int iter = 0; iter < 2000; ++iter) {
            int len = len_d(rng);
            std::string s;
            s.reserve(len);
            for (int i = 0; i < len; ++i) {
                int r = char_d(rng);
                if (r < 5) {
                    s.push_back('\n');
                } else if (r < 7) {
                    s.push_back('\r');
                } else if (r < 8) {
                    s.push_back('\0');
                } else {
                    s.push_back((char)(' ' + (r % 95)));
                }
            }
            auto got = scanLineOffsets(s.data(), s.size());
            auto expected = reference_offsets(s);
            if (got != expected) {
                std::cerr << "Mismatch at iter=" << iter << " len=" << len
                          << " expected " << expected.size() << " lines, got " << got.size() << std::endl;
                return 1;
            }
            for (size_t i = 1; i < got.size(); ++i) {
                ASSERT_TRUE(got[i] > got[i - 1]);
                ASSERT_TRUE(s[got[i] - 1] == '\n');
            }
            if (!got.empty()) {
                ASSERT_TRUE(got[0] == 0);
            }
            ASSERT_TRUE(lines_cover_input(s, got));
        }
    } catch (const std::exception &e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All fuzz tests passed" << std::endl;
    return 0;
}
