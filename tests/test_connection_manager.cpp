#include <catch2/catch.hpp>

#include "ConnectionManager.h"
#include "FakeCast.h"

#include <future>

using namespace std::chrono_literals;

namespace {

ConnectionTimings fastConnection() {
    ConnectionTimings t;
    t.readyTimeout = 10ms;
    t.stabilizeDelay = 0ms;
    return t;
}

struct Fixture {
    EventLog log;
    FakeScript script;
    FakeBrowser browser{log};
    FakeFactory factory{script, log};
    ConnectionManager manager{browser, &factory, fastConnection()};

    Fixture() {
        browser.devices = {castInfo("dev-1", "Kitchen"), castInfo("dev-2", "Office")};
    }
};

} // namespace

TEST_CASE("Connecting twice to the same device opens one session", "[connection]") {
    Fixture f;
    Device d1 = castDevice("dev-1", "Kitchen");

    REQUIRE(f.manager.connect(d1, 50ms));
    REQUIRE(f.manager.connect(d1, 50ms));

    CHECK(f.factory.openCount == 1);
    CHECK(f.browser.browseCount == 1);
    CHECK(f.manager.isConnected());
    CHECK(f.manager.activeDeviceId() == "dev-1");
}

TEST_CASE("Switching devices releases the old one before looking up the new", "[connection]") {
    Fixture f;
    REQUIRE(f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms));
    REQUIRE(f.manager.connect(castDevice("dev-2", "Office"), 50ms));

    auto events = f.log.events();
    int disconnect1 = f.log.indexOf("disconnect:dev-1");
    int open2 = f.log.indexOf("open:dev-2");
    REQUIRE(disconnect1 >= 0);
    REQUIRE(open2 > disconnect1);

    // The second browse happens after dev-1 is gone
    int secondBrowse = -1;
    for (size_t i = 0, seen = 0; i < events.size(); i++) {
        if (events[i] == "browse" && ++seen == 2) {
            secondBrowse = static_cast<int>(i);
            break;
        }
    }
    REQUIRE(secondBrowse > disconnect1);

    CHECK(f.manager.activeDeviceId() == "dev-2");
    CHECK(f.manager.activeFor("dev-1") == nullptr);
    CHECK(f.manager.activeFor("dev-2") != nullptr);
}

TEST_CASE("Device missing from the browse leaves no connection", "[connection]") {
    Fixture f;
    REQUIRE(f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms));

    CHECK_FALSE(f.manager.connect(castDevice("dev-9", "Nowhere"), 50ms));
    CHECK_FALSE(f.manager.isConnected());
    CHECK(f.manager.active() == nullptr);
    CHECK(f.manager.activeDeviceId().empty());
    CHECK(f.log.count("disconnect:dev-1") == 1);
}

TEST_CASE("Session that never becomes ready is torn down", "[connection]") {
    Fixture f;
    f.script.waitResult = false;

    CHECK_FALSE(f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms));
    CHECK(f.log.count("disconnect:dev-1") == 1);
    CHECK(f.manager.activeDeviceId().empty());
    CHECK(f.manager.active() == nullptr);
}

TEST_CASE("Browse exception is a connection failure", "[connection]") {
    Fixture f;
    f.browser.throwOnBrowse = true;

    CHECK_FALSE(f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms));
    CHECK_FALSE(f.manager.isConnected());
    CHECK(f.browser.stopCount >= 1);
}

TEST_CASE("Factory returning nothing is a connection failure", "[connection]") {
    Fixture f;
    f.factory.failOpen = true;

    CHECK_FALSE(f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms));
    CHECK(f.manager.activeDeviceId().empty());
}

TEST_CASE("Without a session factory connect always fails", "[connection]") {
    EventLog log;
    FakeBrowser browser(log);
    browser.devices = {castInfo("dev-1", "Kitchen")};
    ConnectionManager manager(browser, nullptr, fastConnection());

    CHECK_FALSE(manager.hasTransport());
    CHECK_FALSE(manager.connect(castDevice("dev-1", "Kitchen"), 50ms));
    CHECK_FALSE(manager.isConnected());
}

TEST_CASE("Local device cannot be connected", "[connection]") {
    Fixture f;
    CHECK_FALSE(f.manager.connect(Device::local(), 50ms));
    CHECK(f.browser.browseCount == 0);
}

TEST_CASE("Probe exception reads as disconnected", "[connection]") {
    Fixture f;
    REQUIRE(f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms));
    REQUIRE(f.manager.isConnected());

    f.factory.last->throwOnProbe = true;
    CHECK_FALSE(f.manager.isConnected());

    // Stays false even once the probe stops failing
    f.factory.last->throwOnProbe = false;
    CHECK_FALSE(f.manager.isConnected());
    CHECK(f.manager.activeFor("dev-1") == nullptr);
}

TEST_CASE("Dead control socket forces a fresh connect", "[connection]") {
    Fixture f;
    Device d1 = castDevice("dev-1", "Kitchen");
    REQUIRE(f.manager.connect(d1, 50ms));

    f.factory.last->alive = false;
    CHECK_FALSE(f.manager.isConnected());

    REQUIRE(f.manager.connect(d1, 50ms));
    CHECK(f.factory.openCount == 2);
    CHECK(f.manager.isConnected());
}

TEST_CASE("Disconnect is idempotent", "[connection]") {
    Fixture f;
    REQUIRE(f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms));

    f.manager.disconnect();
    f.manager.disconnect();

    CHECK(f.log.count("disconnect:dev-1") == 1);
    CHECK_FALSE(f.manager.isConnected());
    CHECK(f.manager.activeDeviceId().empty());
}

TEST_CASE("State queries do not wait for a connect in progress", "[connection]") {
    Fixture f;
    f.browser.browseDelay = 400ms;

    auto connecting = std::async(std::launch::async, [&f]() {
        return f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms);
    });
    while (f.browser.browseCount == 0) {
        std::this_thread::sleep_for(1ms);
    }

    auto start = std::chrono::steady_clock::now();
    CHECK(f.manager.activeDeviceId().empty());
    CHECK_FALSE(f.manager.isConnected());
    CHECK(f.manager.activeFor("dev-1") == nullptr);
    CHECK(std::chrono::steady_clock::now() - start < 200ms);

    CHECK(connecting.get());
    CHECK(f.manager.activeDeviceId() == "dev-1");
}

TEST_CASE("Disconnect during a connect wins", "[connection]") {
    Fixture f;
    f.browser.browseDelay = 100ms;

    auto connecting = std::async(std::launch::async, [&f]() {
        return f.manager.connect(castDevice("dev-1", "Kitchen"), 50ms);
    });
    while (f.browser.browseCount == 0) {
        std::this_thread::sleep_for(1ms);
    }
    f.manager.disconnect();

    CHECK_FALSE(connecting.get());
    CHECK_FALSE(f.manager.isConnected());
    CHECK(f.manager.activeDeviceId().empty());
    CHECK(f.log.count("disconnect:dev-1") == 1);
}
