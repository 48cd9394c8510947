#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/JsonlReader.hpp"
#include "../src/Errors.hpp"
#include "TestUtils.hpp"

using Lines = std::vector<std::string>;
constexpr std::nullopt_t none = std::nullopt;

static std::string line(int i) {
    return "{\"i\":" + std::to_string(i) + "}";
}

int main() {
    try {
        TempDir dir("jsonl_reader");
        CacheConfig config;
        config.dataDir = dir.file("share");

        // 1) Three records without trailing newline
        std::string small = dir.file("small.jsonl");
        writeFile(small, "{\"a\":1}\n{\"b\":2}\n{\"c\":3}");
        JsonlReader abc(small, config);
        ASSERT_TRUE(abc.length() == 3);
        ASSERT_TRUE(abc.get(1) == "{\"b\":2}");
        ASSERT_TRUE(abc.get(-1) == "{\"c\":3}");
        ASSERT_TRUE(abc.slice(none, none, -1) == (Lines{"{\"c\":3}", "{\"b\":2}", "{\"a\":1}"}));
        ASSERT_TRUE(abc.getJson(2)["c"].asInt() == 3);
        ASSERT_TRUE(abc.record().offsets == (std::vector<uint64_t>{0, 8, 16}));
        ASSERT_TRUE(std::filesystem::exists(abc.cachePath()));

        // 2) Ten records
        std::string path = dir.file("ten.jsonl");
        writeFile(path, numberedLines(10));
        JsonlReader reader(path, config);
        ASSERT_TRUE(reader.length() == 10);
        for (int i = 0; i < 10; ++i) {
            ASSERT_TRUE(reader.get(i) == line(i));
        }
        ASSERT_TRUE(reader.get(-1) == reader.get(9));
        ASSERT_TRUE(reader.get(-10) == line(0));
        ASSERT_THROWS(reader.get(10), IndexOutOfRangeError);
        ASSERT_THROWS(reader.get(-11), IndexOutOfRangeError);

        // 3) Slices
        Lines reversed = reader.slice(none, none, -1);
        ASSERT_TRUE(reversed.size() == 10);
        for (int i = 0; i < 10; ++i) {
            ASSERT_TRUE(reversed[i] == line(9 - i));
        }
        ASSERT_TRUE(reader.slice(2, 5) == (Lines{line(2), line(3), line(4)}));
        ASSERT_TRUE(reader.slice(none, none, 4) == (Lines{line(0), line(4), line(8)}));
        ASSERT_TRUE(reader.slice(-2, none) == (Lines{line(8), line(9)}));
        ASSERT_TRUE(reader.slice(7, 100) == (Lines{line(7), line(8), line(9)}));
        ASSERT_TRUE(reader.slice(5, 2).empty());
        ASSERT_TRUE(reader.slice(none, none).size() == 10);
        ASSERT_THROWS(reader.slice(none, none, 0), std::invalid_argument);

        // 4) Batch access and JSON decoding
        ASSERT_TRUE(reader.getMany({0, -1, 3}) == (Lines{line(0), line(9), line(3)}));
        ASSERT_THROWS(reader.getMany({0, 10}), IndexOutOfRangeError);
        ASSERT_TRUE(reader.getJson(4)["i"].asInt() == 4);

        // 5) Iteration starts over on every pass
        for (int pass = 0; pass < 2; ++pass) {
            int expected = 0;
            for (const std::string& l : reader) {
                ASSERT_TRUE(l == line(expected));
                ++expected;
            }
            ASSERT_TRUE(expected == 10);
        }
        // random access in the middle of an iteration does not disturb it
        auto it = reader.begin();
        ++it;
        ASSERT_TRUE(reader.get(7) == line(7));
        ASSERT_TRUE(*it == line(1));

        // 6) A second reader reuses the persisted cache
        auto stamp = std::filesystem::last_write_time(reader.cachePath());
        JsonlReader again(path, config);
        ASSERT_TRUE(again.cachePath() == reader.cachePath());
        ASSERT_TRUE(again.length() == 10);
        ASSERT_TRUE(std::filesystem::last_write_time(reader.cachePath()) == stamp);

        // 7) Appended data is invisible until recache
        appendFile(path, line(10) + "\n" + line(11) + "\n");
        ASSERT_TRUE(reader.length() == 10);
        reader.recache();
        ASSERT_TRUE(reader.length() == 12);
        ASSERT_TRUE(reader.get(-1) == line(11));

        // recache to a new location
        std::string moved = dir.file("custom/ten.idx");
        reader.recache(moved);
        ASSERT_TRUE(reader.cachePath() == moved);
        ASSERT_TRUE(std::filesystem::exists(moved));
        ASSERT_TRUE(reader.length() == 12);

        // 8) Explicit cache path and the hash check on open
        std::string custom = dir.file("explicit.cache.json");
        CacheConfig explicitConfig = config;
        explicitConfig.cachePath = custom;
        explicitConfig.checkCacheHash = true;
        {
            JsonlReader withHash(path, explicitConfig);
            ASSERT_TRUE(withHash.cachePath() == custom);
            ASSERT_TRUE(withHash.length() == 12);
        }
        appendFile(path, line(12) + "\n");
        {
            JsonlReader rehashed(path, explicitConfig);
            ASSERT_TRUE(rehashed.length() == 13);
        }

        // 9) Malformed JSON is reported on decode only
        std::string mixed = dir.file("mixed.jsonl");
        writeFile(mixed, "{\"ok\":true}\nnot json\n\n{\"ok\":false}\n");
        JsonlReader mixedReader(mixed, config);
        ASSERT_TRUE(mixedReader.length() == 4);
        ASSERT_TRUE(mixedReader.get(1) == "not json");
        ASSERT_TRUE(mixedReader.get(2).empty());
        ASSERT_THROWS(mixedReader.getJson(1), std::runtime_error);
        ASSERT_TRUE(!mixedReader.getJson(3)["ok"].asBool());

        // 10) CRLF: only '\n' is stripped
        std::string crlf = dir.file("crlf.jsonl");
        writeFile(crlf, "{\"a\":1}\r\n{\"b\":2}\r\n");
        JsonlReader crlfReader(crlf, config);
        ASSERT_TRUE(crlfReader.length() == 2);
        ASSERT_TRUE(crlfReader.get(0) == "{\"a\":1}\r");
        ASSERT_TRUE(crlfReader.getJson(1)["b"].asInt() == 2);

        // 11) Empty file
        std::string empty = dir.file("empty.jsonl");
        writeFile(empty, "");
        JsonlReader emptyReader(empty, config);
        ASSERT_TRUE(emptyReader.length() == 0);
        ASSERT_TRUE(emptyReader.slice(none, none).empty());
        ASSERT_TRUE(emptyReader.begin() == emptyReader.end());
        ASSERT_THROWS(emptyReader.get(0), IndexOutOfRangeError);

        // 12) A truncated source behind a trusted cache fails loudly
        std::string shrink = dir.file("shrink.jsonl");
        writeFile(shrink, numberedLines(5));
        JsonlReader shrinkReader(shrink, config);
        writeFile(shrink, numberedLines(2));
        ASSERT_THROWS(shrinkReader.get(4), std::runtime_error);

        // 13) Missing source
        ASSERT_THROWS(JsonlReader(dir.file("missing.jsonl"), config), SourceNotFoundError);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All reader tests passed" << std::endl;
    return 0;
}
