#ifndef MEDIA_DECODER_HPP
#define MEDIA_DECODER_HPP

#include "media_types.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

// Fetches media from a URL, data URL or local path and decodes it to still frames.
// Every failure throws MediaDecodeError.
class MediaDecoder {
public:
    explicit MediaDecoder(int video_frame_count = 5);
    ~MediaDecoder() = default;

    DecodedMedia decode(const std::string& source);

    // Video when the URL contains a known video indicator, image otherwise
    static MediaType detectMediaType(const std::string& url);

    // Evenly spread indices: step = total / (count - 1), last index clamped
    static std::vector<int> sampleIndices(int total_frames, int count);

    std::vector<unsigned char> fetchBytes(const std::string& source) const;
    cv::Mat decodeImage(const std::vector<unsigned char>& bytes) const;
    DecodedMedia decodeVideo(const std::vector<unsigned char>& bytes) const;

private:
    int video_frame_count_;

    static bool isDataUrl(const std::string& input);
    static bool isHttpUrl(const std::string& input);
    static std::vector<unsigned char> decodeBase64(const std::string& data_url);
    std::vector<unsigned char> download(const std::string& url) const;
    std::vector<unsigned char> readFile(const std::string& path) const;

    // 100MB covers short clips
    static constexpr size_t MAX_MEDIA_SIZE = 100 * 1024 * 1024;
    static constexpr long DOWNLOAD_TIMEOUT_SECONDS = 60;
};

#endif // MEDIA_DECODER_HPP
