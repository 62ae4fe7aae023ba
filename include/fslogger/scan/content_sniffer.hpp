#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace fslogger {
namespace scan {

struct SniffResult {
    std::string mime_type;
    size_t bytes_read = 0;
    std::optional<std::string> error;
};

class ContentSniffer {
public:
    // MIME type of a byte prefix, following the WHATWG sniffing order:
    // markup, documents, BOM text, images, media, fonts, archives, then a
    // text/binary decision. Only the first 512 bytes are considered.
    static std::string detect(const std::vector<uint8_t>& data);

    // Reads up to max_bytes from the start of the file. An empty read is not
    // an error; failing to open or read is.
    static SniffResult sniffFile(const std::filesystem::path& path, size_t max_bytes = 512);

    // "text/plain; charset=utf-8" -> "text"
    static std::string primaryType(const std::string& mime_type);
};

}}
