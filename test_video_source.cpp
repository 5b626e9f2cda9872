#include "video_source.hpp"
#include "analysis_errors.hpp"
#include "test_support.hpp"
#include <fstream>

using namespace formcheck;
using namespace formcheck::testing;

int main() {
    std::cout << "=== Video Source Test ===" << std::endl;

    // Test 1: Base64 payloads
    {
        std::vector<unsigned char> hello = decodeBase64Payload("aGVsbG8=");
        assert_true(std::string(hello.begin(), hello.end()) == "hello", "bare base64 decoded");

        std::vector<unsigned char> prefixed = decodeBase64Payload("data:video/mp4;base64,aGVsbG8gd29ybGQ=");
        assert_true(std::string(prefixed.begin(), prefixed.end()) == "hello world", "data URL prefix stripped");

        std::vector<unsigned char> wrapped = decodeBase64Payload("aGVs\nbG8=");
        assert_true(std::string(wrapped.begin(), wrapped.end()) == "hello", "line breaks ignored");

        bool threw = false;
        try {
            decodeBase64Payload("not*base64");
        } catch (const VideoFetchError&) {
            threw = true;
        }
        assert_true(threw, "invalid base64 raises VideoFetchError");

        threw = false;
        try {
            decodeBase64Payload("data:video/mp4,plain");
        } catch (const VideoFetchError&) {
            threw = true;
        }
        assert_true(threw, "non-base64 data URL raises VideoFetchError");
    }

    // Test 2: URLs reach curl with their escapes intact
    {
        // On disk the name holds a literal "%20"; the URL escapes the '%' itself
        ScopedFile literal(tempPath("clip%20one.bin"));
        {
            std::ofstream out(literal.path(), std::ios::binary);
            out << "literal";
        }
        VideoSource fetched = VideoSource::open(VideoReference::url("file://" + tempPath("clip%2520one.bin")));
        assert_true(fetched.isTemporary(), "URL reference downloaded to a temporary file");
        assert_true(std::filesystem::file_size(fetched.path()) == 7, "%25 escape resolved by curl only once");

        ScopedFile spaced(tempPath("clip two.bin"));
        {
            std::ofstream out(spaced.path(), std::ios::binary);
            out << "spaced";
        }
        VideoSource escaped = VideoSource::open(VideoReference::url("file://" + tempPath("clip%20two.bin")));
        assert_true(std::filesystem::file_size(escaped.path()) == 6, "encoded space fetched as given");

        bool threw = false;
        try {
            VideoSource::open(VideoReference::url("file://" + tempPath("clip%20one.bin")));
        } catch (const VideoFetchError&) {
            threw = true;
        }
        assert_true(threw, "URL is not decoded before the fetch");
    }

    // Test 3: Inline bytes live in a temporary file for the source's lifetime
    {
        std::string path;
        {
            VideoSource source = VideoSource::fromBytes({'f', 'a', 'k', 'e'});
            path = source.path();
            assert_true(source.isTemporary(), "inline bytes use a temporary file");
            assert_true(std::filesystem::exists(path), "temporary file exists while in use");
            assert_true(std::filesystem::file_size(path) == 4, "temporary file holds the bytes");

            VideoSource moved = std::move(source);
            assert_true(moved.path() == path && std::filesystem::exists(path), "moving keeps the file alive");
        }
        assert_true(!std::filesystem::exists(path), "temporary file removed when the source is destroyed");
    }

    // Test 4: Data references go through the decoder
    {
        VideoSource source = VideoSource::open(VideoReference::data("data:video/mp4;base64,aGVsbG8="));
        assert_true(std::filesystem::file_size(source.path()) == 5, "data reference materialized");

        bool threw = false;
        try {
            VideoSource::fromBytes({});
        } catch (const VideoFetchError&) {
            threw = true;
        }
        assert_true(threw, "empty payload rejected");
    }

    // Test 5: Local files are used in place
    {
        ScopedFile file(tempPath("local.bin"));
        {
            std::ofstream out(file.path(), std::ios::binary);
            out << "x";
        }
        VideoSource source = VideoSource::open(VideoReference::file(file.path()));
        assert_true(source.path() == file.path() && !source.isTemporary(), "file reference not copied");
    }

    // Test 6: Separate temporary files never collide
    {
        TempVideoFile a;
        TempVideoFile b;
        assert_true(a.path() != b.path(), "temporary names are unique");
    }

    return finish("Video Source");
}
