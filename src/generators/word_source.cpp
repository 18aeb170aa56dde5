/**
 * Word Source Implementation
 */

#include "word_source.hpp"

#include <zlib.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

#ifndef XKPASS_RESOURCE_DIR
#define XKPASS_RESOURCE_DIR "./data"
#endif

namespace xkpass {

namespace {

struct GzCloser {
    void operator()(gzFile_s* file) const {
        if (file) gzclose(file);
    }
};

using GzHandle = std::unique_ptr<gzFile_s, GzCloser>;

}  // namespace

WordList split_lines(std::string_view text) {
    WordList lines;
    size_t start = 0;

    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);

        start = end + 1;
    }

    return lines;
}

// -----------------------------------------------------------------------------
// FileWordSource
// -----------------------------------------------------------------------------

WordList FileWordSource::read_words() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        throw WordSourceUnavailable("Could not open word list: " + path_ +
                                    " (" + std::strerror(errno) + ")");
    }

    WordList words;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        words.push_back(std::move(line));
    }

    if (file.bad()) {
        throw WordSourceUnavailable("Error reading word list: " + path_);
    }

    return words;
}

// -----------------------------------------------------------------------------
// GzipResourceWordSource
// -----------------------------------------------------------------------------

std::string GzipResourceWordSource::resolved_path() const {
    return (std::filesystem::path(resource_dir_) / name_).string();
}

WordList GzipResourceWordSource::read_words() const {
    const std::string path = resolved_path();

    GzHandle file(gzopen(path.c_str(), "rb"));
    if (!file) {
        throw WordSourceUnavailable("Could not open word list resource: ?" + name_ +
                                    " (" + path + ")");
    }

    std::string text;
    char buffer[16384];
    while (true) {
        int n = gzread(file.get(), buffer, sizeof(buffer));
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(file.get(), &errnum);
            throw WordSourceUnavailable("Could not decompress word list resource: ?" + name_ +
                                        " (" + (msg ? msg : "unknown zlib error") + ")");
        }
        if (n == 0) break;
        text.append(buffer, static_cast<size_t>(n));
    }

    return split_lines(text);
}

// -----------------------------------------------------------------------------
// WordSourceFactory
// -----------------------------------------------------------------------------

std::unique_ptr<WordSource> WordSourceFactory::create(
    const std::string& path,
    const std::string& resource_dir
) {
    if (!path.empty() && path.front() == RESOURCE_PREFIX) {
        return std::make_unique<GzipResourceWordSource>(path.substr(1), resource_dir);
    }
    return std::make_unique<FileWordSource>(path);
}

std::string WordSourceFactory::default_resource_dir() {
    const char* env = std::getenv("XKPASS_RESOURCE_DIR");
    if (env && *env) {
        return env;
    }
    return XKPASS_RESOURCE_DIR;
}

}  // namespace xkpass
