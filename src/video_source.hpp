#ifndef VIDEO_SOURCE_HPP
#define VIDEO_SOURCE_HPP

#include <string>
#include <vector>
#include <memory>

namespace formcheck {

// Temporary video file owned by one analysis run. Removed on destruction.
class TempVideoFile {
public:
    explicit TempVideoFile(const std::string& suffix = ".mp4");
    ~TempVideoFile();

    TempVideoFile(const TempVideoFile&) = delete;
    TempVideoFile& operator=(const TempVideoFile&) = delete;

    const std::string& path() const { return path_; }

    // Replaces the file contents; throws VideoFetchError on I/O failure
    void write(const std::vector<unsigned char>& bytes);

private:
    std::string path_;
};

// Where a request's video comes from
struct VideoReference {
    enum class Kind {
        URL,
        DATA,   // data:video/...;base64,<payload> or bare base64
        FILE
    };

    Kind kind;
    std::string value;

    static VideoReference url(const std::string& u) { return VideoReference{Kind::URL, u}; }
    static VideoReference data(const std::string& d) { return VideoReference{Kind::DATA, d}; }
    static VideoReference file(const std::string& p) { return VideoReference{Kind::FILE, p}; }
};

// A video materialized on local disk for the duration of one analysis
class VideoSource {
public:
    // Downloads or decodes the reference as needed; throws VideoFetchError.
    // URLs go to curl exactly as given, percent-escapes included.
    static VideoSource open(const VideoReference& reference);

    static VideoSource fromFile(const std::string& path);
    static VideoSource fromBytes(const std::vector<unsigned char>& bytes);

    VideoSource(VideoSource&&) = default;
    VideoSource& operator=(VideoSource&&) = default;

    const std::string& path() const { return path_; }
    bool isTemporary() const { return temp_ != nullptr; }

    // Maximum accepted download / inline payload size (200MB)
    static constexpr size_t MAX_VIDEO_SIZE = 200 * 1024 * 1024;

private:
    VideoSource() = default;

    std::string path_;
    std::unique_ptr<TempVideoFile> temp_;
};

// Decodes standard base64, with or without a data URL prefix. Throws VideoFetchError.
std::vector<unsigned char> decodeBase64Payload(const std::string& payload);

} // namespace formcheck

#endif // VIDEO_SOURCE_HPP
