#include "resonant/local_collection.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include "resonant/ensure.hpp"
#include "resonant/parsing/html.hpp"

namespace resonant {

namespace {

    enum class FileKind { Text, Html };

    [[nodiscard]] auto file_kind(std::filesystem::path const& path) -> std::optional<FileKind> {
        auto extension = boost::algorithm::to_lower_copy(path.extension().string());
        if (extension == ".txt") {
            return FileKind::Text;
        }
        if (extension == ".html" || extension == ".htm") {
            return FileKind::Html;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto read_file(std::filesystem::path const& path) -> std::string {
        std::ifstream is(path, std::ios::binary);
        ensure(is.is_open()).or_throw_with<std::runtime_error>("Unable to open {}", path.string());
        std::ostringstream contents;
        contents << is.rdbuf();
        return contents.str();
    }

}  // namespace

auto read_document(std::filesystem::path const& path) -> std::optional<CrawledDocument> {
    auto kind = file_kind(path);
    if (not kind) {
        return std::nullopt;
    }
    auto contents = read_file(path);
    auto text = *kind == FileKind::Html ? parsing::html::cleantext(contents) : std::move(contents);
    return CrawledDocument{path.string(), path.stem().string(), std::move(text)};
}

auto load_directory(std::filesystem::path const& directory, RankingEngine& engine) -> std::size_t {
    ensure(std::filesystem::is_directory(directory))
        .or_throw_with("{} is not a directory", directory.string());
    std::size_t accepted = 0;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator entries(directory, ec);
    for (auto end = std::filesystem::recursive_directory_iterator(); not ec && entries != end;
         entries.increment(ec)) {
        auto const& entry = *entries;
        std::error_code status_ec;
        if (not entry.is_regular_file(status_ec)) {
            if (status_ec) {
                spdlog::warn("Skipping {}: {}", entry.path().string(), status_ec.message());
            }
            continue;
        }
        try {
            auto document = read_document(entry.path());
            if (not document) {
                continue;
            }
            if (engine.ingest(std::move(*document))) {
                ++accepted;
            } else {
                spdlog::debug("No indexable text in {}", entry.path().string());
            }
        } catch (std::exception const& error) {
            spdlog::warn("Skipping {}: {}", entry.path().string(), error.what());
        }
    }
    if (ec) {
        spdlog::warn("Stopped walking {}: {}", directory.string(), ec.message());
    }
    spdlog::info("Loaded {} documents from {}", accepted, directory.string());
    return accepted;
}

}  // namespace resonant
