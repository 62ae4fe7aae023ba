#include "fslogger/scan/content_sniffer.hpp"
#include "fslogger/common/constants.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <system_error>

namespace fslogger {
namespace scan {

namespace {

constexpr const char* TEXT_UTF8 = "text/plain; charset=utf-8";
constexpr const char* OCTET_STREAM = "application/octet-stream";

struct Signature {
    std::string pattern;
    std::string mask;
    bool skip_whitespace;
    const char* mime_type;
};

bool isWhitespace(uint8_t b) {
    return b == '\t' || b == '\n' || b == '\x0c' || b == '\r' || b == ' ';
}

bool isTagTerminator(uint8_t b) {
    return b == ' ' || b == '>';
}

// Bytes that never appear in text: C0 controls except TAB, LF, FF, CR, ESC
bool isBinaryByte(uint8_t b) {
    return b <= 0x08 || b == 0x0b || (b >= 0x0e && b <= 0x1a) || (b >= 0x1c && b <= 0x1f);
}

size_t firstNonWhitespace(const std::vector<uint8_t>& data) {
    size_t i = 0;
    while (i < data.size() && isWhitespace(data[i])) {
        ++i;
    }
    return i;
}

bool hasPrefix(const std::vector<uint8_t>& data, const std::string& prefix, size_t offset = 0) {
    if (data.size() < offset + prefix.size()) {
        return false;
    }
    return std::memcmp(data.data() + offset, prefix.data(), prefix.size()) == 0;
}

bool matchesMasked(const std::vector<uint8_t>& data, const Signature& sig) {
    size_t offset = sig.skip_whitespace ? firstNonWhitespace(data) : 0;
    if (data.size() < offset + sig.pattern.size()) {
        return false;
    }

    for (size_t i = 0; i < sig.pattern.size(); ++i) {
        uint8_t mask = sig.mask.empty() ? 0xFF : static_cast<uint8_t>(sig.mask[i]);
        if ((data[offset + i] & mask) != static_cast<uint8_t>(sig.pattern[i])) {
            return false;
        }
    }
    return true;
}

// Case-insensitive tag match followed by a space or '>'
bool matchesHtml(const std::vector<uint8_t>& data, const std::string& tag) {
    size_t offset = firstNonWhitespace(data);
    if (data.size() < offset + tag.size() + 1) {
        return false;
    }

    for (size_t i = 0; i < tag.size(); ++i) {
        uint8_t b = data[offset + i];
        uint8_t expected = static_cast<uint8_t>(tag[i]);
        if (expected >= 'A' && expected <= 'Z') {
            b &= 0xDF;
        }
        if (b != expected) {
            return false;
        }
    }
    return isTagTerminator(data[offset + tag.size()]);
}

bool isMp4(const std::vector<uint8_t>& data) {
    if (data.size() < 12) {
        return false;
    }

    uint32_t box_size = (static_cast<uint32_t>(data[0]) << 24) |
                        (static_cast<uint32_t>(data[1]) << 16) |
                        (static_cast<uint32_t>(data[2]) << 8) |
                        static_cast<uint32_t>(data[3]);
    if (data.size() < box_size || box_size % 4 != 0) {
        return false;
    }

    if (!hasPrefix(data, "ftyp", 4)) {
        return false;
    }

    for (uint32_t start = 8; start < box_size; start += 4) {
        if (start == 12) {
            continue;
        }
        if (hasPrefix(data, "mp4", start)) {
            return true;
        }
    }
    return false;
}

std::string bytes(std::initializer_list<uint8_t> values) {
    return std::string(values.begin(), values.end());
}

const std::vector<std::string>& htmlTags() {
    static const std::vector<std::string> tags = {
        "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1", "<DIV",
        "<FONT", "<TABLE", "<A", "<STYLE", "<TITLE", "<B", "<BODY", "<BR", "<P", "<!--"
    };
    return tags;
}

const std::vector<Signature>& signatures() {
    static const std::string riff_mask = bytes({0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF});
    static const std::string zero4 = bytes({0x00, 0x00, 0x00, 0x00});

    static const std::vector<Signature> sigs = {
        {"<?xml", "", true, "text/xml; charset=utf-8"},
        {"%PDF-", "", false, "application/pdf"},
        {"%!PS-Adobe-", "", false, "application/postscript"},

        {bytes({0xFE, 0xFF}), "", false, "text/plain; charset=utf-16be"},
        {bytes({0xFF, 0xFE}), "", false, "text/plain; charset=utf-16le"},
        {bytes({0xEF, 0xBB, 0xBF}), "", false, TEXT_UTF8},

        {bytes({0x00, 0x00, 0x01, 0x00}), "", false, "image/x-icon"},
        {bytes({0x00, 0x00, 0x02, 0x00}), "", false, "image/x-icon"},
        {"BM", "", false, "image/bmp"},
        {"GIF87a", "", false, "image/gif"},
        {"GIF89a", "", false, "image/gif"},
        {"RIFF" + zero4 + "WEBPVP", riff_mask + bytes({0xFF, 0xFF}), false, "image/webp"},
        {bytes({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A}), "", false, "image/png"},
        {bytes({0xFF, 0xD8, 0xFF}), "", false, "image/jpeg"},

        {"FORM" + zero4 + "AIFF", riff_mask, false, "audio/aiff"},
        {"ID3", "", false, "audio/mpeg"},
        {"OggS" + bytes({0x00}), "", false, "application/ogg"},
        {"MThd" + bytes({0x00, 0x00, 0x00, 0x06}), "", false, "audio/midi"},
        {"RIFF" + zero4 + "AVI ", riff_mask, false, "video/avi"},
        {"RIFF" + zero4 + "WAVE", riff_mask, false, "audio/wave"},
        {"", "", false, "video/mp4"},
        {bytes({0x1A, 0x45, 0xDF, 0xA3}), "", false, "video/webm"},

        {"OTTO", "", false, "font/otf"},
        {"ttcf", "", false, "font/collection"},
        {"wOFF", "", false, "font/woff"},
        {"wOF2", "", false, "font/woff2"},
        {bytes({0x00, 0x01, 0x00, 0x00}), "", false, "font/ttf"},
        {std::string(34, '\0') + "LP", std::string(34, '\0') + bytes({0xFF, 0xFF}), false,
         "application/vnd.ms-fontobject"},

        {bytes({0x1F, 0x8B, 0x08}), "", false, "application/x-gzip"},
        {"PK" + bytes({0x03, 0x04}), "", false, "application/zip"},
        {"Rar!" + bytes({0x1A, 0x07, 0x00}), "", false, "application/x-rar-compressed"},
        {"Rar!" + bytes({0x1A, 0x07, 0x01, 0x00}), "", false, "application/x-rar-compressed"},
        {bytes({0x00, 'a', 's', 'm'}), "", false, "application/wasm"},
    };
    return sigs;
}

}

std::string ContentSniffer::detect(const std::vector<uint8_t>& data) {
    const size_t length = std::min(data.size(), constants::limits::SNIFF_LENGTH);
    std::vector<uint8_t> head(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(length));

    for (const auto& tag : htmlTags()) {
        if (matchesHtml(head, tag)) {
            return "text/html; charset=utf-8";
        }
    }

    for (const auto& sig : signatures()) {
        if (sig.pattern.empty()) {
            if (isMp4(head)) {
                return sig.mime_type;
            }
            continue;
        }
        if (matchesMasked(head, sig)) {
            return sig.mime_type;
        }
    }

    for (uint8_t b : head) {
        if (isBinaryByte(b)) {
            return OCTET_STREAM;
        }
    }

    return TEXT_UTF8;
}

SniffResult ContentSniffer::sniffFile(const std::filesystem::path& path, size_t max_bytes) {
    SniffResult result;

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        int err = errno;
        result.error = err != 0
            ? std::error_code(err, std::generic_category()).message()
            : std::string("failed to open file");
        return result;
    }

    std::vector<uint8_t> header(max_bytes);
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(max_bytes));
    auto count = file.gcount();

    if (file.bad() && count <= 0) {
        int err = errno;
        result.error = err != 0
            ? std::error_code(err, std::generic_category()).message()
            : std::string("failed to read file");
        return result;
    }

    header.resize(count > 0 ? static_cast<size_t>(count) : 0);
    result.bytes_read = header.size();
    result.mime_type = detect(header);
    return result;
}

std::string ContentSniffer::primaryType(const std::string& mime_type) {
    auto slash = mime_type.find('/');
    return slash == std::string::npos ? mime_type : mime_type.substr(0, slash);
}

}}
