#include <catch2/catch.hpp>
#include "BonjourIfAddrs.hpp"
#include "BonjourScanDefs.hpp"

static BonjourIfAddr makeIfAddr(const int ethno, const std::string &name, const std::string &addr, const bool isUp = true)
{
    BonjourIfAddr ifAddr;
    ifAddr.ethno = ethno;
    ifAddr.name = name;
    ifAddr.addr = addr;
    ifAddr.ipVer = (addr.find(':') == std::string::npos)?BONJOUR_SCAN_IPVER_INET:BONJOUR_SCAN_IPVER_INET6;
    ifAddr.isUp = isUp;
    return ifAddr;
}

static std::vector<BonjourIfAddr> sampleIfAddrs(void)
{
    return {
        makeIfAddr(1, "lo0", "127.0.0.1"),
        makeIfAddr(1, "lo0", "::1"),
        makeIfAddr(1, "lo0", "fe80::1"),
        makeIfAddr(4, "en0", "192.168.1.20"),
        makeIfAddr(4, "en0", "fe80::18c4:2bff:fe11:aa01"),
        makeIfAddr(7, "en5", "10.0.0.3"),
        makeIfAddr(7, "en5", "fe80::5"),
        makeIfAddr(9, "en9", "172.16.0.9", false),
        makeIfAddr(9, "en9", "fe80::9", false),
    };
}

TEST_CASE("IPv4 filter skips loopback and keeps system order", "[ifaddrs]") {
    const auto addrs = filterBonjourIfAddrs(sampleIfAddrs(), BONJOUR_SCAN_IPVER_INET, BONJOUR_SCAN_ZONE_NAME);

    REQUIRE(addrs == std::vector<std::string>{"192.168.1.20", "10.0.0.3"});
}

TEST_CASE("IPv6 filter skips reserved addresses and adds the zone", "[ifaddrs]") {
    SECTION("Zone by interface name") {
        const auto addrs = filterBonjourIfAddrs(sampleIfAddrs(), BONJOUR_SCAN_IPVER_INET6, BONJOUR_SCAN_ZONE_NAME);
        REQUIRE(addrs == std::vector<std::string>{"fe80::18c4:2bff:fe11:aa01%en0", "fe80::5%en5"});
    }

    SECTION("Zone by interface index") {
        const auto addrs = filterBonjourIfAddrs(sampleIfAddrs(), BONJOUR_SCAN_IPVER_INET6, BONJOUR_SCAN_ZONE_INDEX);
        REQUIRE(addrs == std::vector<std::string>{"fe80::18c4:2bff:fe11:aa01%4", "fe80::5%7"});
    }
}

TEST_CASE("Zone suffix is split from the address", "[ifaddrs]") {
    std::string zone;
    REQUIRE(splitBonjourZone("fe80::5%en0", zone) == "fe80::5");
    REQUIRE(zone == "en0");

    REQUIRE(splitBonjourZone("192.168.1.20", zone) == "192.168.1.20");
    REQUIRE(zone.empty());
}

TEST_CASE("Interface index lookup", "[ifaddrs]") {
    const auto ifAddrs = sampleIfAddrs();

    REQUIRE(lookupBonjourIfIndex("fe80::5%12", ifAddrs) == 12);
    REQUIRE(lookupBonjourIfIndex("fe80::5%en5", ifAddrs) == 7);
    REQUIRE(lookupBonjourIfIndex("192.168.1.20", ifAddrs) == 4);
    REQUIRE(lookupBonjourIfIndex("203.0.113.1", ifAddrs) == BONJOUR_SCAN_IF_UNSPEC);
    REQUIRE(lookupBonjourIfIndex("fe80::5%nosuchif0", ifAddrs) == BONJOUR_SCAN_IF_UNSPEC);
}

TEST_CASE("Live interface list has numeric addresses", "[ifaddrs]") {
    for (const auto &ifAddr : listBonjourIfAddrs())
    {
        REQUIRE_FALSE(ifAddr.addr.empty());
        REQUIRE(ifAddr.addr.find('%') == std::string::npos);
        REQUIRE((ifAddr.ipVer == BONJOUR_SCAN_IPVER_INET or ifAddr.ipVer == BONJOUR_SCAN_IPVER_INET6));
    }
}

TEST_CASE("Default interface entry is not usable until filled", "[ifaddrs]") {
    const BonjourIfAddr ifAddr;
    REQUIRE(ifAddr.ethno == 0);
    REQUIRE(ifAddr.ipVer == 0);
    REQUIRE_FALSE(ifAddr.isUp);
    REQUIRE(filterBonjourIfAddrs({ifAddr}, BONJOUR_SCAN_IPVER_INET, BONJOUR_SCAN_ZONE_NAME).empty());
    REQUIRE(filterBonjourIfAddrs({ifAddr}, BONJOUR_SCAN_IPVER_INET6, BONJOUR_SCAN_ZONE_NAME).empty());
}
