#include <catch2/catch.hpp>
#include "FakeMDNSClient.hpp"
#include "BonjourDiscoverySession.hpp"
#include "BonjourEventLoop.hpp"
#include "BonjourScanDefs.hpp"

static const std::string SERVICE = BONJOUR_SCAN_MOBDEV2_SERVICE;

TEST_CASE("Session resolves the first notification", "[integration][session]") {
    FakeNetwork network;
    auto &response = network.responses["192.168.1.20"];
    response.notifyDelayUs = 5*1000;
    response.resolveDelayUs = 5*1000;
    response.record = makeFakeRecord("192.168.1.77", 32498, "device-a");

    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "192.168.1.20", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
    loop.runFor(80*1000);

    const auto &listener = session.getListener();
    REQUIRE(listener.getState() == BONJOUR_RESOLUTION_RESOLVED);
    REQUIRE(listener.getAddresses() == std::vector<std::string>{"192.168.1.77"});
    REQUIRE(listener.getPort() == 32498);
    REQUIRE(listener.getProperties().at("identifier") == "device-a");
    REQUIRE(network.countEvents("browse:192.168.1.20:" + SERVICE) == 1);

    session.close();
    REQUIRE(network.clientsClosed == 1);
}

TEST_CASE("Session only resolves one notification", "[integration][session]") {
    FakeNetwork network;
    auto &response = network.responses["192.168.1.20"];
    response.notifyCount = 3;
    response.record = makeFakeRecord("192.168.1.77", 1, "device-a");

    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "192.168.1.20", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
    loop.runFor(50*1000);

    REQUIRE(network.countEvents("resolve:") == 1);
    REQUIRE(network.indexOf("resolve:192.168.1.20:Device0." + SERVICE) >= 0);
    REQUIRE(session.getListener().pendingCount() == 2);
    REQUIRE(session.getListener().getState() == BONJOUR_RESOLUTION_RESOLVED);
}

TEST_CASE("Session without notification contributes nothing", "[integration][session]") {
    FakeNetwork network;
    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "10.0.0.3", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
    loop.runFor(30*1000);

    REQUIRE(session.getListener().getState() == BONJOUR_RESOLUTION_IDLE);
    REQUIRE(session.getListener().getAddresses().empty());
    REQUIRE_NOTHROW(session.close());
    REQUIRE(session.getListener().getState() == BONJOUR_RESOLUTION_CANCELLED);
}

TEST_CASE("Resolve past its bound fails without an answer", "[integration][session]") {
    FakeNetwork network;
    auto &response = network.responses["10.0.0.3"];
    response.resolveDelayUs = 500*1000;
    response.record = makeFakeRecord("10.0.0.50", 1, "slow");

    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "10.0.0.3", 20*1000);
    loop.runFor(100*1000);

    REQUIRE(session.getListener().getState() == BONJOUR_RESOLUTION_FAILED);
    REQUIRE(session.getListener().getAddresses().empty());
    REQUIRE(network.countEvents("resolver-cancel:10.0.0.3") == 1);
}

TEST_CASE("Resolve failure leaves addresses empty", "[integration][session]") {
    FakeNetwork network;
    auto &response = network.responses["10.0.0.3"];
    response.found = false;

    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "10.0.0.3", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
    loop.runFor(30*1000);

    REQUIRE(session.getListener().getState() == BONJOUR_RESOLUTION_FAILED);
    REQUIRE(session.getListener().getAddresses().empty());
}

TEST_CASE("Session close cancels the task before the browser and client", "[integration][session]") {
    FakeNetwork network;
    auto &response = network.responses["10.0.0.3"];
    response.resolveDelayUs = 500*1000;
    response.record = makeFakeRecord("10.0.0.50", 1, "slow");

    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "10.0.0.3", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
    loop.runFor(30*1000);
    REQUIRE(session.getListener().getState() == BONJOUR_RESOLUTION_RESOLVING);

    session.close();

    REQUIRE(session.getListener().getState() == BONJOUR_RESOLUTION_CANCELLED);
    REQUIRE(session.getListener().getAddresses().empty());

    const int resolverCancel = network.indexOf("resolver-cancel:10.0.0.3");
    const int browserCancel = network.indexOf("browser-cancel:10.0.0.3");
    const int clientClose = network.indexOf("client-close:10.0.0.3");
    REQUIRE(resolverCancel >= 0);
    REQUIRE(resolverCancel < browserCancel);
    REQUIRE(browserCancel < clientClose);

    //nothing fires into the closed client
    loop.runFor(20*1000);
    REQUIRE(network.countEvents("use-after-close:") == 0);
}

TEST_CASE("Session close is idempotent", "[integration][session]") {
    FakeNetwork network;
    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "10.0.0.3", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);

    REQUIRE_NOTHROW(session.close());
    REQUIRE_NOTHROW(session.close());
    REQUIRE(session.closed());
    REQUIRE(network.clientsClosed == 1);
    REQUIRE(network.countEvents("browser-cancel:") == 1);
}

TEST_CASE("Session close finishes teardown when a step throws", "[integration][session]") {
    FakeNetwork network;
    network.throwOnBrowserCancel = true;
    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "10.0.0.3", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);

    REQUIRE_NOTHROW(session.close());
    REQUIRE(network.clientsClosed == 1);
}

TEST_CASE("Unbindable interface yields an inert session", "[integration][session]") {
    FakeNetwork network;
    network.unbindable.insert("10.0.0.3");
    network.responses["10.0.0.3"].record = makeFakeRecord("10.0.0.50", 1, "x");

    BonjourEventLoop loop;
    BonjourDiscoverySession session(loop, network.factory(), SERVICE, "10.0.0.3", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
    loop.runFor(20*1000);

    REQUIRE(network.countEvents("browse:") == 0);
    REQUIRE(session.getListener().getAddresses().empty());
    REQUIRE_NOTHROW(session.close());
    REQUIRE(network.clientsClosed == 1);
}

TEST_CASE("IPv6 answers carry the session zone", "[integration][session]") {
    BonjourServiceRecord record;
    record.ipv4 = {"192.168.1.77"};
    record.ipv6 = {"fe80::aaaa", "fe80::bbbb"};
    record.port = 58783;

    SECTION("Scoped IPv6 session") {
        FakeNetwork network;
        network.responses["fe80::5%en0"].record = record;

        BonjourEventLoop loop;
        BonjourDiscoverySession session(loop, network.factory(), BONJOUR_SCAN_REMOTED_SERVICE, "fe80::5%en0", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
        loop.runFor(30*1000);

        REQUIRE(session.getListener().getAddresses() ==
            std::vector<std::string>{"192.168.1.77", "fe80::aaaa%en0", "fe80::bbbb%en0"});
    }

    SECTION("IPv4 session drops unscoped IPv6") {
        FakeNetwork network;
        network.responses["192.168.1.20"].record = record;

        BonjourEventLoop loop;
        BonjourDiscoverySession session(loop, network.factory(), BONJOUR_SCAN_REMOTED_SERVICE, "192.168.1.20", BONJOUR_SCAN_RESOLVE_TIMEOUT_US);
        loop.runFor(30*1000);

        REQUIRE(session.getListener().getAddresses() == std::vector<std::string>{"192.168.1.77"});
    }
}
