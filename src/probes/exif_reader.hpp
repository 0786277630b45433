#ifndef EXIF_READER_HPP
#define EXIF_READER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace probes {

struct ImageMetadata {
    bool has_exif = false;
    std::map<std::string, std::string> tags;   // ASCII EXIF tags by name, PNG text chunks as "png:<keyword>"

    bool has(const std::string& key) const { return tags.count(key) > 0; }
    std::string get(const std::string& key) const;
};

// Minimal metadata reader for JPEG APP1/Exif, PNG eXIf and PNG text chunks.
class ExifReader {
public:
    static ImageMetadata read(const std::vector<unsigned char>& bytes);

private:
    static void readJpeg(const std::vector<unsigned char>& bytes, ImageMetadata& metadata);
    static void readPng(const std::vector<unsigned char>& bytes, ImageMetadata& metadata);
    static void readTiff(const unsigned char* data, size_t length, ImageMetadata& metadata);
    static void readIfd(const unsigned char* data, size_t length, uint32_t offset, bool little_endian,
                        int depth, ImageMetadata& metadata);

    static uint16_t readU16(const unsigned char* p, bool little_endian);
    static uint32_t readU32(const unsigned char* p, bool little_endian);
    static std::string tagName(uint16_t tag);

    static constexpr uint16_t EXIF_IFD_POINTER = 0x8769;
    static constexpr uint16_t TYPE_ASCII = 2;
    static constexpr int MAX_IFD_DEPTH = 2;
    static constexpr int MAX_IFD_ENTRIES = 512;
};

} // namespace probes

#endif // EXIF_READER_HPP
