/**
 * Logger Tests
 *
 * Log file creation, level filtering and generator log output.
 */

#include "../src/core/logger.hpp"
#include "../src/generators/passphrase_generator.hpp"
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>
#include <vector>

using namespace xkpass;
using namespace xkpass::testing;

void test_generator_logging() {
    auto dir = make_temp_dir("logger");

    Logger& logger = Logger::instance();
    assert(logger.init(dir.string(), Logger::Level::DEBUG));
    assert(logger.get_log_path() == (dir / "xkpass.log").string());
    assert(logger.enabled(Logger::Level::DEBUG));

    GeneratorConfig config;
    config.set_separator_character(CharChoice::fixed('-'));
    PassphraseGenerator generator(config, std::make_shared<MersenneRandomSource>(8));
    generator.set_word_source(std::make_shared<MemoryWordSource>(
        WordList{"correct", "horse", "battery", "staple", "four"}));

    std::string password = generator.generate();

    std::string log = read_file(logger.get_log_path());
    assert(log.find("=== xkpass Logger Started ===") != std::string::npos);
    assert(log.find("WORDLIST: Source=<memory:5>, Words=5, Suitable=4") != std::string::npos);
    assert(log.find("[DEBUG]") != std::string::npos);

    // Passwords never reach the log
    assert(log.find(password) == std::string::npos);

    std::cout << "[PASS] Generator logging\n";
}

void test_errors_logged() {
    GeneratorConfig config;
    config.set_min_word_length(20);
    config.set_max_word_length(30);
    PassphraseGenerator generator(config, std::make_shared<MersenneRandomSource>(8));
    generator.set_word_source(std::make_shared<MemoryWordSource>(WordList{"horse"}));

    bool threw = false;
    try {
        generator.generate();
    } catch (const EmptyCandidateSet&) {
        threw = true;
    }
    assert(threw);

    std::string log = read_file(Logger::instance().get_log_path());
    assert(log.find("[ERROR] ERROR: No words longer than 20") != std::string::npos);

    std::cout << "[PASS] Errors logged\n";
}

void test_level_filter() {
    auto dir = make_temp_dir("logger_level");

    Logger& logger = Logger::instance();
    assert(logger.init(dir.string(), Logger::Level::WARN));
    assert(!logger.enabled(Logger::Level::INFO));

    LOG_INFO("quiet info");
    LOG_DEBUG("quiet debug");
    LOG_WARN("loud warning");

    std::string log = read_file(logger.get_log_path());
    assert(log.find("quiet") == std::string::npos);
    assert(log.find("[WARN ] loud warning") != std::string::npos);

    std::cout << "[PASS] Level filter\n";
}

void test_concurrent_init_and_enabled() {
    auto dir = make_temp_dir("logger_threads");
    Logger& logger = Logger::instance();

    std::atomic<bool> stop{false};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                if (logger.enabled(Logger::Level::DEBUG)) {
                    LOG_DEBUG("reader tick");
                }
                LOG_WARN("reader warning");
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        const auto level = (i % 2 == 0) ? Logger::Level::DEBUG : Logger::Level::WARN;
        assert(logger.init(dir.string(), level));
    }
    stop = true;
    for (auto& reader : readers) reader.join();

    // Last init was at WARN
    assert(!logger.enabled(Logger::Level::DEBUG));
    assert(logger.enabled(Logger::Level::WARN));

    std::string log = read_file(logger.get_log_path());
    assert(log.find("=== xkpass Logger Started ===") != std::string::npos);

    std::cout << "[PASS] Concurrent init and level checks\n";
}

int main() {
    std::cout << "=== Logger Tests ===\n\n";

    test_generator_logging();
    test_errors_logged();
    test_level_filter();
    test_concurrent_init_and_enabled();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
