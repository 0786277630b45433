#include "media_decoder.hpp"
#include "fakescan_errors.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::vector<unsigned char>* userp) {
    size_t total_size = size * nmemb;
    size_t old_size = userp->size();
    userp->resize(old_size + total_size);
    std::memcpy(&((*userp)[old_size]), contents, total_size);
    return total_size;
}

// Removes the temp file when decoding leaves scope
class TempFile {
public:
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}

MediaDecoder::MediaDecoder(int video_frame_count) : video_frame_count_(video_frame_count) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

MediaType MediaDecoder::detectMediaType(const std::string& url) {
    std::string lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower.rfind("data:video/", 0) == 0) {
        return MediaType::VIDEO;
    }
    static const std::vector<std::string> video_indicators = {
        "/video/", ".mp4", ".mov", ".avi", ".webm", ".mkv", "video/upload"
    };
    for (const auto& indicator : video_indicators) {
        if (lower.find(indicator) != std::string::npos) {
            return MediaType::VIDEO;
        }
    }
    return MediaType::IMAGE;
}

std::vector<int> MediaDecoder::sampleIndices(int total_frames, int count) {
    std::vector<int> indices;
    if (total_frames <= 0 || count <= 0) {
        return indices;
    }
    if (total_frames <= count) {
        for (int i = 0; i < total_frames; ++i) {
            indices.push_back(i);
        }
        return indices;
    }
    if (count == 1) {
        indices.push_back(0);
        return indices;
    }

    double step = static_cast<double>(total_frames) / (count - 1);
    for (int i = 0; i < count; ++i) {
        indices.push_back(static_cast<int>(i * step));
    }
    indices.back() = std::min(indices.back(), total_frames - 1);
    return indices;
}

bool MediaDecoder::isDataUrl(const std::string& input) {
    return input.rfind("data:", 0) == 0 && input.find("base64,") != std::string::npos;
}

bool MediaDecoder::isHttpUrl(const std::string& input) {
    return input.rfind("http://", 0) == 0 || input.rfind("https://", 0) == 0;
}

std::vector<unsigned char> MediaDecoder::decodeBase64(const std::string& data_url) {
    size_t comma_pos = data_url.find("base64,");
    std::string base64_data = data_url.substr(comma_pos + 7);

    const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::vector<int> lookup(256, -1);
    for (int i = 0; i < 64; i++) {
        lookup[static_cast<unsigned char>(chars[i])] = i;
    }

    std::vector<unsigned char> decoded;
    decoded.reserve((base64_data.length() * 3) / 4);
    unsigned int val = 0;
    int valb = -8;
    for (unsigned char c : base64_data) {
        if (lookup[c] == -1) break;
        val = (val << 6) + lookup[c];
        valb += 6;
        if (valb >= 0) {
            decoded.push_back(static_cast<unsigned char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    if (decoded.size() > MAX_MEDIA_SIZE) {
        throw MediaDecodeError("data URL exceeds size limit: " + std::to_string(decoded.size()) + " bytes");
    }
    return decoded;
}

std::vector<unsigned char> MediaDecoder::download(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw MediaDecodeError("failed to initialize curl");
    }

    std::vector<unsigned char> data;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &data);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, DOWNLOAD_TIMEOUT_SECONDS);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE, static_cast<long>(MAX_MEDIA_SIZE));

    CURLcode res = curl_easy_perform(curl);
    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw MediaDecodeError(std::string("download failed: ") + curl_easy_strerror(res));
    }
    if (response_code != 200) {
        throw MediaDecodeError("download failed with HTTP " + std::to_string(response_code));
    }
    if (data.empty()) {
        throw MediaDecodeError("downloaded media is empty");
    }

    std::cout << "Media decoder: downloaded " << data.size() / 1024 << " KB from " << url << std::endl;
    return data;
}

std::vector<unsigned char> MediaDecoder::readFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw MediaDecodeError("cannot open media file: " + path);
    }
    std::vector<unsigned char> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (data.empty()) {
        throw MediaDecodeError("media file is empty: " + path);
    }
    if (data.size() > MAX_MEDIA_SIZE) {
        throw MediaDecodeError("media file exceeds size limit: " + path);
    }
    return data;
}

std::vector<unsigned char> MediaDecoder::fetchBytes(const std::string& source) const {
    if (source.empty()) {
        throw MediaDecodeError("empty media source");
    }
    if (isDataUrl(source)) {
        std::vector<unsigned char> decoded = decodeBase64(source);
        if (decoded.empty()) {
            throw MediaDecodeError("data URL carries no payload");
        }
        return decoded;
    }
    if (isHttpUrl(source)) {
        return download(source);
    }
    return readFile(source);
}

cv::Mat MediaDecoder::decodeImage(const std::vector<unsigned char>& bytes) const {
    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw MediaDecodeError("bytes are not a decodable image");
    }
    return image;
}

DecodedMedia MediaDecoder::decodeVideo(const std::vector<unsigned char>& bytes) const {
    auto now = std::chrono::system_clock::now().time_since_epoch().count();
    TempFile temp((std::filesystem::temp_directory_path() / ("fakescan_video_" + std::to_string(now) + ".mp4")).string());

    {
        std::ofstream file(temp.path(), std::ios::binary);
        if (!file.is_open()) {
            throw MediaDecodeError("cannot create temp file for video");
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    cv::VideoCapture cap(temp.path());
    if (!cap.isOpened()) {
        throw MediaDecodeError("failed to open video stream");
    }

    DecodedMedia media;
    media.type = MediaType::VIDEO;
    media.total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    media.fps = cap.get(cv::CAP_PROP_FPS);

    std::cout << "Media decoder: video " << media.total_frames << " frames at " << media.fps << " fps" << std::endl;

    for (int index : sampleIndices(media.total_frames, video_frame_count_)) {
        cap.set(cv::CAP_PROP_POS_FRAMES, index);
        cv::Mat frame;
        if (cap.read(frame) && !frame.empty()) {
            media.frames.push_back(frame.clone());
            media.frame_indices.push_back(index);
        } else {
            std::cerr << "Media decoder: could not read video frame " << index << std::endl;
        }
    }
    cap.release();

    if (media.frames.empty()) {
        throw MediaDecodeError("no frames could be decoded from video");
    }
    return media;
}

DecodedMedia MediaDecoder::decode(const std::string& source) {
    MediaType type = detectMediaType(source);
    std::vector<unsigned char> bytes = fetchBytes(source);

    DecodedMedia media;
    if (type == MediaType::VIDEO) {
        media = decodeVideo(bytes);
    } else {
        media.type = MediaType::IMAGE;
        media.frames.push_back(decodeImage(bytes));
        media.frame_indices.push_back(0);
        media.total_frames = 1;
        media.raw_bytes = std::move(bytes);
    }
    media.source = source;
    return media;
}
