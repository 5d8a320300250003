#include <catch2/catch.hpp>

#include "MediaServer.h"
#include "ScopedPaths.h"
#include "TestUtil.h"

#include <filesystem>

namespace {

struct ServedDir {
    ScopedTempDir dir{"castspeak-http"};
    MediaServer server;
    uint16_t port = 0;

    ServedDir() {
        writeFile(dir.path() + "/clip.mp3", 1000);
        writeFile(dir.path() + "/two words.mp3", 300);
        std::filesystem::create_directory(dir.path() + "/sub");
        port = server.start(dir.path());
    }
};

} // namespace

TEST_CASE("Serves a file with its content type and length", "[http]") {
    ServedDir s;
    REQUIRE(s.port != 0);

    std::string resp = httpGet(s.port, "/clip.mp3");
    CHECK(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(resp.find("Content-Type: audio/mpeg\r\n") != std::string::npos);
    CHECK(resp.find("Content-Length: 1000\r\n") != std::string::npos);
    CHECK(resp.find("Access-Control-Allow-Origin: *\r\n") != std::string::npos);
    CHECK(bodyOf(resp).size() == 1000);
    CHECK(s.server.requestsServed() == 1);
}

TEST_CASE("HEAD returns headers only", "[http]") {
    ServedDir s;
    std::string resp = httpExchange(s.port, "HEAD /clip.mp3 HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(resp.rfind("HTTP/1.1 200 OK", 0) == 0);
    CHECK(resp.find("Content-Length: 1000\r\n") != std::string::npos);
    CHECK(bodyOf(resp).empty());
}

TEST_CASE("Percent-encoded names resolve", "[http]") {
    ServedDir s;
    CHECK(MediaServer::encodePathSegment("two words.mp3") == "two%20words.mp3");

    std::string resp = httpGet(s.port, "/two%20words.mp3");
    CHECK(resp.rfind("HTTP/1.1 200", 0) == 0);
    CHECK(bodyOf(resp).size() == 300);
}

TEST_CASE("Byte ranges are honoured", "[http]") {
    ServedDir s;

    SECTION("explicit range") {
        std::string resp = httpGet(s.port, "/clip.mp3", "Range: bytes=10-19\r\n");
        CHECK(resp.rfind("HTTP/1.1 206 Partial Content", 0) == 0);
        CHECK(resp.find("Content-Range: bytes 10-19/1000\r\n") != std::string::npos);
        CHECK(bodyOf(resp).size() == 10);
    }

    SECTION("range past the end") {
        std::string resp = httpGet(s.port, "/clip.mp3", "Range: bytes=5000-\r\n");
        CHECK(resp.rfind("HTTP/1.1 416", 0) == 0);
        CHECK(resp.find("Content-Range: bytes */1000\r\n") != std::string::npos);
    }
}

TEST_CASE("Paths outside the root, directories and missing files are 404", "[http]") {
    ServedDir s;
    CHECK(httpGet(s.port, "/../etc/passwd").rfind("HTTP/1.1 404", 0) == 0);
    CHECK(httpGet(s.port, "/%2e%2e/etc/passwd").rfind("HTTP/1.1 404", 0) == 0);
    CHECK(httpGet(s.port, "/").rfind("HTTP/1.1 404", 0) == 0);
    CHECK(httpGet(s.port, "/sub").rfind("HTTP/1.1 404", 0) == 0);
    CHECK(httpGet(s.port, "/nope.mp3").rfind("HTTP/1.1 404", 0) == 0);
}

TEST_CASE("Only GET and HEAD are allowed", "[http]") {
    ServedDir s;
    std::string resp = httpExchange(s.port, "POST /clip.mp3 HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(resp.rfind("HTTP/1.1 405", 0) == 0);
}

TEST_CASE("Stop closes the port and restores the working directory", "[http]") {
    std::string before = std::filesystem::current_path().string();
    ScopedTempDir dir("castspeak-http");
    writeFile(dir.path() + "/clip.mp3", 200);

    MediaServer server;
    uint16_t port = server.start(dir.path());
    REQUIRE(port != 0);
    CHECK(server.isRunning());
    CHECK(std::filesystem::current_path() == std::filesystem::canonical(dir.path()));

    server.stop();
    CHECK_FALSE(server.isRunning());
    CHECK_FALSE(canConnect(port));
    CHECK(std::filesystem::current_path().string() == before);

    server.stop();
    CHECK(std::filesystem::current_path().string() == before);
}

TEST_CASE("Relative paths resolve against the directory before serving", "[http]") {
    std::string before = std::filesystem::current_path().string();
    CHECK(ScopedWorkingDirectory::callerDirectory() == before);
    CHECK(ScopedWorkingDirectory::absoluteFromCaller("/abs/clip.mp3") == "/abs/clip.mp3");

    ScopedTempDir dir("castspeak-http");
    {
        ScopedWorkingDirectory moved(dir.path());
        REQUIRE(moved.ok());
        CHECK(ScopedWorkingDirectory::callerDirectory() == before);
        CHECK(ScopedWorkingDirectory::absoluteFromCaller("speech.mp3") ==
              (std::filesystem::path(before) / "speech.mp3").string());
    }
    CHECK(std::filesystem::current_path().string() == before);
    CHECK(ScopedWorkingDirectory::callerDirectory() == before);
}

TEST_CASE("Starting on a missing directory fails cleanly", "[http]") {
    std::string before = std::filesystem::current_path().string();
    MediaServer server;
    CHECK(server.start("/nonexistent/castspeak/dir") == 0);
    CHECK_FALSE(server.isRunning());
    CHECK(std::filesystem::current_path().string() == before);
}

TEST_CASE("Range header parsing", "[http]") {
    uint64_t first = 0, last = 0;
    using R = MediaServer::RangeResult;

    CHECK(MediaServer::parseRange("", 100, first, last) == R::NONE);
    CHECK(MediaServer::parseRange("items=0-1", 100, first, last) == R::NONE);
    CHECK(MediaServer::parseRange("bytes=0-1,5-6", 100, first, last) == R::NONE);

    REQUIRE(MediaServer::parseRange("bytes=-10", 100, first, last) == R::OK);
    CHECK(first == 90);
    CHECK(last == 99);

    REQUIRE(MediaServer::parseRange("bytes=50-", 100, first, last) == R::OK);
    CHECK(first == 50);
    CHECK(last == 99);

    // End past the file is clamped to the last byte
    REQUIRE(MediaServer::parseRange("bytes=0-1000", 100, first, last) == R::OK);
    CHECK(last == 99);

    CHECK(MediaServer::parseRange("bytes=100-", 100, first, last) == R::UNSATISFIABLE);
    CHECK(MediaServer::parseRange("bytes=99999999999999999999-", 100, first, last) == R::NONE);
}

TEST_CASE("Content types follow the extension", "[http]") {
    CHECK(std::string(MediaServer::contentTypeFor("a.MP3")) == "audio/mpeg");
    CHECK(std::string(MediaServer::contentTypeFor("a.wav")) == "audio/wav");
    CHECK(std::string(MediaServer::contentTypeFor("a.bin")) == "application/octet-stream");
}

TEST_CASE("Percent decoding rejects malformed escapes", "[http]") {
    std::string out;
    CHECK(MediaServer::decodePath("/a%20b", out));
    CHECK(out == "/a b");
    CHECK_FALSE(MediaServer::decodePath("/a%2", out));
    CHECK_FALSE(MediaServer::decodePath("/a%zz", out));
}
