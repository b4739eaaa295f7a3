#pragma once

/// @file document_io.hpp
/// @brief Whole-document file load and save.

#include "error.hpp"
#include "parse_options.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "value.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <istream>
#include <string>
#include <string_view>

namespace treedit {

namespace detail {

/// @brief Read an entire istream into a string.
///
/// Seekable streams are sized and read in one pass; anything else is read
/// in 64 KB chunks.
inline std::string read_stream(std::istream& is) {
    std::string content;

    const auto start_pos = is.tellg();
    if (start_pos != std::istream::pos_type(-1)) {
        is.seekg(0, std::ios::end);
        const auto end_pos = is.tellg();
        if (end_pos != std::istream::pos_type(-1) && end_pos > start_pos) {
            const auto size = static_cast<size_t>(end_pos - start_pos);
            content.resize(size);
            is.seekg(start_pos);
            is.read(content.data(), static_cast<std::streamsize>(size));
            content.resize(static_cast<size_t>(is.gcount()));
            return content;
        }
        is.clear();
        is.seekg(start_pos);
    }

    constexpr size_t kChunkSize = 65536;
    char buf[kChunkSize];
    while (is.read(buf, sizeof(buf)) || is.gcount() > 0) {
        content.append(buf, static_cast<size_t>(is.gcount()));
    }
    return content;
}

} // namespace detail

/// @brief Read and parse a whole file.
/// @throws IoError if the file cannot be opened, FormatError on bad content.
[[nodiscard]] inline Node load_file(const std::string& path, const ParseOptions& opts = {}) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw IoError(errc::file_open_failed, path);
    const std::string content = detail::read_stream(ifs);
    Node doc = parse(std::string_view(content), opts);
    spdlog::info("loaded {} ({} bytes)", path, content.size());
    return doc;
}

/// @brief Print @p doc and write it to @p path, replacing the file.
/// @throws IoError if the file cannot be opened or written.
inline void save_file(const std::string& path, const Node& doc, const SerializeOptions& opts = {}) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) throw IoError(errc::file_open_failed, path);
    print(ofs, doc, opts);
    ofs.put('\n');
    ofs.flush();
    if (!ofs) throw IoError(errc::file_write_failed, path);
    spdlog::info("saved {}", path);
}

} // namespace treedit
