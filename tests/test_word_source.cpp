/**
 * Word Source Tests
 *
 * Plain file, bundled gzip resource and in-memory word lists.
 */

#include "../src/generators/word_source.hpp"
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>

using namespace xkpass;
using namespace xkpass::testing;

void test_split_lines() {
    assert(split_lines("") == WordList{});
    assert((split_lines("a\nb\n") == WordList{"a", "b"}));
    assert((split_lines("a\r\nb") == WordList{"a", "b"}));
    assert((split_lines("a\n\nb\n") == WordList{"a", "", "b"}));

    std::cout << "[PASS] Split lines\n";
}

void test_file_source() {
    auto dir = make_temp_dir("file_source");
    auto path = dir / "words.txt";
    write_file(path, "correct\r\nhorse\nbattery\nstaple\n");

    FileWordSource source(path.string());
    WordList words = source.read_words();

    assert((words == WordList{"correct", "horse", "battery", "staple"}));
    assert(source.describe() == path.string());

    // Every read is a full re-read of the file
    write_file(path, "zebra\n");
    assert((source.read_words() == WordList{"zebra"}));

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] File word source\n";
}

void test_missing_file() {
    FileWordSource source("/nonexistent/xkpass/words.txt");

    bool threw = false;
    try {
        source.read_words();
    } catch (const WordSourceUnavailable& e) {
        threw = true;
        assert(std::string(e.what()).find("/nonexistent/xkpass/words.txt") != std::string::npos);
    }
    assert(threw);

    std::cout << "[PASS] Missing file raises WordSourceUnavailable\n";
}

void test_bundled_resource() {
    GzipResourceWordSource source("en.gz", XKPASS_RESOURCE_DIR);
    WordList words = source.read_words();

    assert(words.size() > 1000);
    assert(std::find(words.begin(), words.end(), "correct") != words.end());
    assert(std::find(words.begin(), words.end(), "horse") != words.end());
    assert(std::find(words.begin(), words.end(), "staple") != words.end());
    assert(source.describe() == "?en.gz");

    for (const auto& word : words) {
        assert(!word.empty());
        assert(word.find('\r') == std::string::npos);
    }

    std::cout << "[PASS] Bundled gzip resource\n";
}

void test_missing_resource() {
    GzipResourceWordSource source("xx.gz", XKPASS_RESOURCE_DIR);

    bool threw = false;
    try {
        source.read_words();
    } catch (const WordSourceUnavailable&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Missing resource raises WordSourceUnavailable\n";
}

void test_factory() {
    auto resource = WordSourceFactory::create("?en.gz", "/opt/xkpass/data");
    auto* gz = dynamic_cast<GzipResourceWordSource*>(resource.get());
    assert(gz != nullptr);
    assert(gz->resolved_path() == "/opt/xkpass/data/en.gz");

    auto file = WordSourceFactory::create("/usr/share/words.txt", "/opt/xkpass/data");
    assert(dynamic_cast<FileWordSource*>(file.get()) != nullptr);
    assert(file->describe() == "/usr/share/words.txt");

    std::cout << "[PASS] Word source factory\n";
}

void test_memory_source() {
    MemoryWordSource source({"one", "two"});
    assert((source.read_words() == WordList{"one", "two"}));
    assert(source.describe() == "<memory:2>");

    std::cout << "[PASS] Memory word source\n";
}

int main() {
    std::cout << "=== Word Source Tests ===\n\n";

    test_split_lines();
    test_file_source();
    test_missing_file();
    test_bundled_resource();
    test_missing_resource();
    test_factory();
    test_memory_source();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
