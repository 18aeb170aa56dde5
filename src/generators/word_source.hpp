/**
 * xkpass Word Sources
 *
 * Providers of the raw candidate word sequence (one word per line).
 * Every read is a fresh, complete read of the underlying source; the file or
 * gzip handle is released before read_words() returns or throws.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/errors.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace xkpass {

/**
 * Base class for word sources.
 */
class WordSource {
public:
    virtual ~WordSource() = default;

    /**
     * Read every line of the source.
     * @throws WordSourceUnavailable if the source cannot be opened or read
     */
    virtual WordList read_words() const = 0;

    /**
     * Human-readable description for log messages.
     */
    virtual std::string describe() const = 0;
};

/**
 * Plain text word list on disk.
 */
class FileWordSource : public WordSource {
public:
    explicit FileWordSource(std::string path) : path_(std::move(path)) {}

    WordList read_words() const override;
    std::string describe() const override { return path_; }

private:
    std::string path_;
};

/**
 * Gzip-compressed word list bundled with the library, addressed by name
 * ("en.gz") relative to a resource directory.
 */
class GzipResourceWordSource : public WordSource {
public:
    GzipResourceWordSource(std::string name, std::string resource_dir)
        : name_(std::move(name)), resource_dir_(std::move(resource_dir)) {}

    WordList read_words() const override;
    std::string describe() const override { return "?" + name_; }

    std::string resolved_path() const;

private:
    std::string name_;
    std::string resource_dir_;
};

/**
 * In-memory word list.
 */
class MemoryWordSource : public WordSource {
public:
    explicit MemoryWordSource(WordList words) : words_(std::move(words)) {}

    WordList read_words() const override { return words_; }
    std::string describe() const override {
        return "<memory:" + std::to_string(words_.size()) + ">";
    }

private:
    WordList words_;
};

/**
 * Factory for word sources addressed by path.
 */
class WordSourceFactory {
public:
    static constexpr char RESOURCE_PREFIX = '?';

    /**
     * "?name" selects a bundled gzip resource under resource_dir,
     * anything else a plain text file.
     */
    static std::unique_ptr<WordSource> create(
        const std::string& path,
        const std::string& resource_dir = default_resource_dir()
    );

    /**
     * XKPASS_RESOURCE_DIR from the environment, else the directory compiled
     * in at build time.
     */
    static std::string default_resource_dir();
};

/**
 * Split text into lines, dropping a trailing '\r' from each.
 * A final line without a newline is kept; a trailing newline does not add
 * an empty line.
 */
WordList split_lines(std::string_view text);

}  // namespace xkpass
