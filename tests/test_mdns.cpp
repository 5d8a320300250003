#include <catch2/catch.hpp>

#include "MdnsBrowser.h"

#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace {

ResolvedService resolved(const std::string& name, const std::string& address,
                         std::map<std::string, std::string> txt, uint16_t port = 8009) {
    ResolvedService svc;
    svc.name = name;
    svc.hostName = name + ".local";
    svc.address = address;
    svc.port = port;
    svc.txt = std::move(txt);
    return svc;
}

} // namespace

TEST_CASE("TXT entries become a lowercase-keyed map", "[mdns]") {
    AvahiStringList* txt = avahi_string_list_new("ID=0123456789abcdef0123456789abcdef",
                                                 "fn=Kitchen speaker", "md=Google Home",
                                                 "bare", "=nokey", nullptr);
    REQUIRE(txt != nullptr);

    auto records = MdnsBrowser::txtRecords(txt);
    avahi_string_list_free(txt);

    CHECK(records.at("id") == "0123456789abcdef0123456789abcdef");
    CHECK(records.at("fn") == "Kitchen speaker");
    CHECK(records.at("md") == "Google Home");
    CHECK(records.at("bare").empty());
    CHECK(records.size() == 4);

    CHECK(MdnsBrowser::txtRecords(nullptr).empty());
}

TEST_CASE("A resolved instance yields one cast device", "[mdns]") {
    std::vector<ResolvedService> services = {
        resolved("Chromecast-Audio-0123", "192.168.1.40",
                 {{"id", "0123456789abcdef0123456789ABCDEF"},
                  {"fn", "Kitchen speaker"},
                  {"md", "Google Home"}}),
    };

    auto devices = MdnsBrowser::devices(services);
    REQUIRE(devices.size() == 1);
    CHECK(devices[0].uuid == "01234567-89ab-cdef-0123-456789abcdef");
    CHECK(devices[0].friendlyName == "Kitchen speaker");
    CHECK(devices[0].model == "Google Home");
    CHECK(devices[0].host == "192.168.1.40");
    CHECK(devices[0].port == 8009);
}

TEST_CASE("Missing name and port fall back", "[mdns]") {
    std::vector<ResolvedService> services = {
        resolved("Office", "10.0.0.9", {{"id", "abc"}}, 0),
    };

    auto devices = MdnsBrowser::devices(services);
    REQUIRE(devices.size() == 1);
    CHECK(devices[0].uuid == "abc");
    CHECK(devices[0].friendlyName == "Office");
    CHECK(devices[0].port == CAST_DEFAULT_PORT);
}

TEST_CASE("Instances reported on several interfaces are merged", "[mdns]") {
    std::vector<ResolvedService> services = {
        resolved("Den", "10.0.0.3", {{"id", "den-1"}, {"fn", "Den"}}),
        resolved("Den", "10.0.0.3", {{"id", "den-1"}, {"fn", "Den"}}),
        resolved("Hall", "10.0.0.4", {{"id", "hall-1"}, {"fn", "Hall"}}),
    };

    auto devices = MdnsBrowser::devices(services);
    REQUIRE(devices.size() == 2);
    CHECK(devices[0].uuid == "den-1");
    CHECK(devices[1].uuid == "hall-1");
}

TEST_CASE("Instances without an id or address are skipped", "[mdns]") {
    std::vector<ResolvedService> services = {
        resolved("No id", "10.0.0.2", {{"fn", "No id"}}),
        resolved("Empty id", "10.0.0.2", {{"id", ""}}),
        resolved("No address", "", {{"id", "x"}}),
    };
    CHECK(MdnsBrowser::devices(services).empty());
}

TEST_CASE("UUID formatting", "[mdns]") {
    CHECK(MdnsBrowser::formatUuid("0123456789ABCDEF0123456789abcdef") ==
          "01234567-89ab-cdef-0123-456789abcdef");
    CHECK(MdnsBrowser::formatUuid("short") == "short");
    CHECK(MdnsBrowser::formatUuid("0123456789abcdef0123456789abcdeg") ==
          "0123456789abcdef0123456789abcdeg");
}

TEST_CASE("stopDiscovery ends a running browse early", "[mdns]") {
    MdnsBrowser browser;
    auto start = std::chrono::steady_clock::now();

    auto result = std::async(std::launch::async, [&browser] {
        return browser.browse(std::chrono::seconds(10));
    });

    // Stop as soon as the browse is underway (or it gave up on its own)
    while (!browser.browsing() &&
           result.wait_for(std::chrono::milliseconds(5)) != std::future_status::ready) {
    }
    browser.stopDiscovery();
    result.get();

    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
    CHECK_FALSE(browser.browsing());
    CHECK_FALSE(browser.stopPending());
}

TEST_CASE("stopDiscovery without a running browse is dropped", "[mdns]") {
    MdnsBrowser browser;
    browser.stopDiscovery();
    CHECK_FALSE(browser.stopPending());
    CHECK_FALSE(browser.browsing());
}
