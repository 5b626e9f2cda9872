#include "video_source.hpp"
#include "analysis_errors.hpp"
#include <curl/curl.h>
#include <cctype>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>

namespace formcheck {

namespace {

std::atomic<unsigned long> temp_file_counter{0};

// Write callback for CURL, streaming the body straight into the temp file
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::ofstream* file = static_cast<std::ofstream*>(userp);
    file->write(static_cast<char*>(contents), total_size);
    return file->good() ? total_size : 0;
}

std::string makeTempPath(const std::string& suffix) {
    std::hash<std::thread::id> hasher;
    auto now = std::chrono::system_clock::now().time_since_epoch().count();
    std::string name = "formcheck_video_" + std::to_string(now) + "_" +
                       std::to_string(hasher(std::this_thread::get_id())) + "_" +
                       std::to_string(temp_file_counter++) + suffix;
    return (std::filesystem::temp_directory_path() / name).string();
}

std::string guessSuffix(const std::string& reference) {
    std::string lower = reference;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    // Ignore query strings on signed URLs
    size_t query = lower.find('?');
    if (query != std::string::npos) {
        lower = lower.substr(0, query);
    }
    const char* known[] = {".mov", ".avi", ".mkv", ".webm", ".mp4"};
    for (const char* ext : known) {
        std::string e(ext);
        if (lower.size() >= e.size() && lower.compare(lower.size() - e.size(), e.size(), e) == 0) {
            return e;
        }
    }
    return ".mp4";
}

void downloadToFile(const std::string& url, const TempVideoFile& target) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw VideoFetchError("failed to initialize curl");
    }

    std::ofstream file(target.path(), std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        curl_easy_cleanup(curl);
        throw VideoFetchError("cannot open temporary file " + target.path());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(VideoSource::MAX_VIDEO_SIZE));

    CURLcode res = curl_easy_perform(curl);
    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    curl_easy_cleanup(curl);
    file.close();

    if (res != CURLE_OK) {
        throw VideoFetchError(std::string("failed to download video: ") + curl_easy_strerror(res));
    }
    // Non-HTTP schemes (file://) report no status code
    bool is_http = url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
    if (is_http && response_code != 200) {
        throw VideoFetchError("failed to download video: HTTP " + std::to_string(response_code));
    }
    if (std::filesystem::file_size(target.path()) == 0) {
        throw VideoFetchError("downloaded video is empty");
    }
}

} // namespace

TempVideoFile::TempVideoFile(const std::string& suffix) : path_(makeTempPath(suffix)) {
    std::ofstream touch(path_, std::ios::binary);
    if (!touch.is_open()) {
        throw VideoFetchError("cannot create temporary file " + path_);
    }
}

TempVideoFile::~TempVideoFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        std::cerr << "Warning: failed to remove temporary video " << path_ << ": " << ec.message() << std::endl;
    }
}

void TempVideoFile::write(const std::vector<unsigned char>& bytes) {
    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw VideoFetchError("cannot open temporary file " + path_);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file.good()) {
        throw VideoFetchError("failed writing temporary file " + path_);
    }
}

VideoSource VideoSource::open(const VideoReference& reference) {
    switch (reference.kind) {
        case VideoReference::Kind::URL: {
            VideoSource source;
            source.temp_ = std::make_unique<TempVideoFile>(guessSuffix(reference.value));
            source.path_ = source.temp_->path();
            downloadToFile(reference.value, *source.temp_);
            std::cout << "Downloaded video " << reference.value << " ("
                      << std::filesystem::file_size(source.path_) << " bytes)" << std::endl;
            return source;
        }
        case VideoReference::Kind::DATA:
            return fromBytes(decodeBase64Payload(reference.value));
        case VideoReference::Kind::FILE:
        default:
            return fromFile(reference.value);
    }
}

VideoSource VideoSource::fromFile(const std::string& path) {
    VideoSource source;
    source.path_ = path;
    return source;
}

VideoSource VideoSource::fromBytes(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        throw VideoFetchError("video payload is empty");
    }
    if (bytes.size() > MAX_VIDEO_SIZE) {
        throw VideoFetchError("video payload exceeds limit: " + std::to_string(bytes.size()) + " bytes");
    }

    VideoSource source;
    source.temp_ = std::make_unique<TempVideoFile>();
    source.temp_->write(bytes);
    source.path_ = source.temp_->path();
    return source;
}

std::vector<unsigned char> decodeBase64Payload(const std::string& payload) {
    std::string base64_data = payload;

    // Strip a data URL prefix if present
    if (payload.compare(0, 5, "data:") == 0) {
        size_t comma_pos = payload.find("base64,");
        if (comma_pos == std::string::npos) {
            throw VideoFetchError("data URL is not base64 encoded");
        }
        base64_data = payload.substr(comma_pos + 7);
    }

    const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::vector<int> lookup(256, -1);
    for (int i = 0; i < 64; i++) {
        lookup[static_cast<unsigned char>(chars[i])] = i;
    }

    std::vector<unsigned char> decoded;
    decoded.reserve((base64_data.length() * 3) / 4);

    int val = 0, valb = -8;
    for (unsigned char c : base64_data) {
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ') continue;
        if (lookup[c] == -1) {
            throw VideoFetchError("invalid character in base64 payload");
        }
        val = (val << 6) + lookup[c];
        valb += 6;
        if (valb >= 0) {
            decoded.push_back(static_cast<unsigned char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    if (decoded.empty()) {
        throw VideoFetchError("base64 payload decoded to zero bytes");
    }
    return decoded;
}

} // namespace formcheck
