#include <catch2/catch.hpp>

#include "AudioProbe.h"
#include "ScopedPaths.h"
#include "TestUtil.h"

#include <filesystem>

TEST_CASE("Probing a missing path reports nothing", "[probe]") {
    AudioInfo info = probeAudio("/nonexistent/castspeak/clip.mp3");
    CHECK_FALSE(info.exists);
    CHECK(info.sizeBytes == 0);
    CHECK_FALSE(info.decoded);
    CHECK(info.durationMs == 0);
}

TEST_CASE("Probing a directory is not a file", "[probe]") {
    ScopedTempDir dir("castspeak-probe");
    CHECK_FALSE(probeAudio(dir.path()).exists);
}

TEST_CASE("A non-MPEG file has a size but no duration", "[probe]") {
    ScopedTempDir dir("castspeak-probe");
    std::string path = dir.path() + "/notes.mp3";
    writeFile(path, 4096, 'a');

    AudioInfo info = probeAudio(path);
    CHECK(info.exists);
    CHECK(info.sizeBytes == 4096);
    CHECK_FALSE(info.decoded);
    CHECK(info.durationMs == 0);
}

TEST_CASE("An empty file exists with size zero", "[probe]") {
    ScopedTempDir dir("castspeak-probe");
    std::string path = dir.path() + "/empty.mp3";
    writeFile(path, 0);

    AudioInfo info = probeAudio(path);
    CHECK(info.exists);
    CHECK(info.sizeBytes == 0);
    CHECK_FALSE(info.decoded);
}
