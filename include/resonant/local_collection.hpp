#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

#include "document.hpp"
#include "ranking_engine.hpp"

namespace resonant {

/**
 * Reads a local file as a document: `.txt` files verbatim, `.html` and `.htm` files with markup
 * stripped. The title is the file name without extension and the identifier is the path.
 *
 * Returns `std::nullopt` for other file types. Throws `std::runtime_error` if the file cannot be
 * read.
 */
[[nodiscard]] auto read_document(std::filesystem::path const& path) -> std::optional<CrawledDocument>;

/// Recursively ingests all supported files under `directory`. Entries that cannot be read are
/// logged and skipped. Returns the number of documents accepted by the engine.
auto load_directory(std::filesystem::path const& directory, RankingEngine& engine) -> std::size_t;

}  // namespace resonant
