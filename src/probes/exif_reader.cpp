#include "exif_reader.hpp"
#include <cstring>

namespace probes {

std::string ImageMetadata::get(const std::string& key) const {
    auto it = tags.find(key);
    return it == tags.end() ? std::string() : it->second;
}

ImageMetadata ExifReader::read(const std::vector<unsigned char>& bytes) {
    ImageMetadata metadata;
    if (bytes.size() >= 4 && bytes[0] == 0xFF && bytes[1] == 0xD8) {
        readJpeg(bytes, metadata);
    } else if (bytes.size() >= 8 && std::memcmp(bytes.data(), "\x89PNG\r\n\x1a\n", 8) == 0) {
        readPng(bytes, metadata);
    }
    return metadata;
}

uint16_t ExifReader::readU16(const unsigned char* p, bool little_endian) {
    return little_endian ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                         : static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t ExifReader::readU32(const unsigned char* p, bool little_endian) {
    if (little_endian) {
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    }
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

std::string ExifReader::tagName(uint16_t tag) {
    switch (tag) {
        case 0x010E: return "ImageDescription";
        case 0x010F: return "Make";
        case 0x0110: return "Model";
        case 0x0131: return "Software";
        case 0x0132: return "DateTime";
        case 0x013B: return "Artist";
        case 0x9003: return "DateTimeOriginal";
        case 0x9004: return "DateTimeDigitized";
        default: return "";
    }
}

void ExifReader::readJpeg(const std::vector<unsigned char>& bytes, ImageMetadata& metadata) {
    size_t pos = 2;
    while (pos + 4 <= bytes.size()) {
        if (bytes[pos] != 0xFF) {
            break;
        }
        unsigned char marker = bytes[pos + 1];
        if (marker == 0xFF) {
            pos++;
            continue;
        }
        if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        // Metadata segments all precede the scan data
        if (marker == 0xDA || marker == 0xD9) {
            break;
        }

        size_t segment_length = (static_cast<size_t>(bytes[pos + 2]) << 8) | bytes[pos + 3];
        if (segment_length < 2 || pos + 2 + segment_length > bytes.size()) {
            break;
        }

        const unsigned char* segment = bytes.data() + pos + 4;
        size_t payload = segment_length - 2;
        if (marker == 0xE1 && payload > 6 && std::memcmp(segment, "Exif\0\0", 6) == 0) {
            metadata.has_exif = true;
            readTiff(segment + 6, payload - 6, metadata);
        }
        pos += 2 + segment_length;
    }
}

void ExifReader::readPng(const std::vector<unsigned char>& bytes, ImageMetadata& metadata) {
    size_t pos = 8;
    while (pos + 12 <= bytes.size()) {
        uint32_t length = readU32(bytes.data() + pos, false);
        if (pos + 12 + length > bytes.size()) {
            break;
        }
        std::string type(reinterpret_cast<const char*>(bytes.data() + pos + 4), 4);
        const unsigned char* data = bytes.data() + pos + 8;

        if (type == "eXIf") {
            metadata.has_exif = true;
            readTiff(data, length, metadata);
        } else if (type == "tEXt" || type == "iTXt") {
            const char* text = reinterpret_cast<const char*>(data);
            size_t keyword_end = 0;
            while (keyword_end < length && text[keyword_end] != '\0') {
                keyword_end++;
            }
            std::string keyword(text, keyword_end);
            size_t value_start = keyword_end + 1;
            if (type == "iTXt") {
                // compression flag, method, language tag, translated keyword
                bool compressed = value_start < length && data[value_start] != 0;
                value_start += 2;
                for (int field = 0; field < 2 && value_start <= length; field++) {
                    while (value_start < length && text[value_start] != '\0') {
                        value_start++;
                    }
                    value_start++;
                }
                if (compressed) {
                    value_start = length;
                }
            }
            std::string value;
            if (value_start < length) {
                value.assign(text + value_start, length - value_start);
            }
            if (!keyword.empty()) {
                metadata.tags["png:" + keyword] = value;
            }
        } else if (type == "IEND") {
            break;
        }
        pos += 12 + length;
    }
}

void ExifReader::readTiff(const unsigned char* data, size_t length, ImageMetadata& metadata) {
    if (length < 8) {
        return;
    }
    bool little_endian;
    if (data[0] == 'I' && data[1] == 'I') {
        little_endian = true;
    } else if (data[0] == 'M' && data[1] == 'M') {
        little_endian = false;
    } else {
        return;
    }
    if (readU16(data + 2, little_endian) != 42) {
        return;
    }
    readIfd(data, length, readU32(data + 4, little_endian), little_endian, 0, metadata);
}

void ExifReader::readIfd(const unsigned char* data, size_t length, uint32_t offset, bool little_endian,
                         int depth, ImageMetadata& metadata) {
    if (depth > MAX_IFD_DEPTH || static_cast<size_t>(offset) + 2 > length) {
        return;
    }
    int entries = readU16(data + offset, little_endian);
    if (entries > MAX_IFD_ENTRIES) {
        return;
    }

    for (int i = 0; i < entries; i++) {
        size_t entry = static_cast<size_t>(offset) + 2 + static_cast<size_t>(i) * 12;
        if (entry + 12 > length) {
            return;
        }
        uint16_t tag = readU16(data + entry, little_endian);
        uint16_t type = readU16(data + entry + 2, little_endian);
        uint32_t count = readU32(data + entry + 4, little_endian);
        uint32_t value = readU32(data + entry + 8, little_endian);

        if (tag == EXIF_IFD_POINTER) {
            readIfd(data, length, value, little_endian, depth + 1, metadata);
            continue;
        }

        std::string name = tagName(tag);
        if (name.empty() || type != TYPE_ASCII || count == 0) {
            continue;
        }

        const unsigned char* text = (count <= 4) ? data + entry + 8 : data + value;
        if (count > 4 && static_cast<size_t>(value) + count > length) {
            continue;
        }
        std::string str(reinterpret_cast<const char*>(text), count);
        size_t nul = str.find('\0');
        if (nul != std::string::npos) {
            str.resize(nul);
        }
        while (!str.empty() && str.back() == ' ') {
            str.pop_back();
        }
        if (!str.empty()) {
            metadata.tags[name] = str;
        }
    }
}

} // namespace probes
