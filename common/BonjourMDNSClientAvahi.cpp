// Copyright (c) 2018-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourMDNSClient.hpp"
#include "BonjourEventLoop.hpp"
#include "BonjourIfAddrs.hpp"
#include "BonjourScanDefs.hpp"
#include "BonjourAvahiUtils.hpp"
#include <SoapySDR/Logger.hpp>
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/defs.h>
#include <avahi-common/error.h>

static AvahiProtocol ifAddrToAvahiProtocol(const std::string &ifAddr)
{
    return (ifAddr.find(':') != std::string::npos)? AVAHI_PROTO_INET6 : AVAHI_PROTO_INET;
}

static int avahiProtocolToIpVer(const AvahiProtocol protocol)
{
    int ipVer = BONJOUR_SCAN_IPVER_UNSPEC;
    if (protocol == AVAHI_PROTO_UNSPEC) ipVer = BONJOUR_SCAN_IPVER_UNSPEC;
    if (protocol == AVAHI_PROTO_INET)   ipVer = BONJOUR_SCAN_IPVER_INET;
    if (protocol == AVAHI_PROTO_INET6)  ipVer = BONJOUR_SCAN_IPVER_INET6;
    return ipVer;
}

/***********************************************************************
 * Browser subscription
 **********************************************************************/
class BonjourMDNSClientAvahi;

class BonjourServiceBrowserAvahi : public BonjourServiceBrowser
{
public:
    BonjourServiceBrowserAvahi(BonjourMDNSClientAvahi &client, const std::string &serviceType, const BonjourMDNSClient::StateChangeHandler &handler):
        client(client),
        serviceType(serviceType),
        handler(handler),
        browser(nullptr)
    {
        return;
    }

    ~BonjourServiceBrowserAvahi(void)
    {
        this->cancel();
    }

    void cancel(void)
    {
        if (browser != nullptr) avahi_service_browser_free(browser);
        browser = nullptr;
    }

    static void browserCallback(
        AvahiServiceBrowser *b,
        AvahiIfIndex interface,
        AvahiProtocol protocol,
        AvahiBrowserEvent event,
        const char *name,
        const char *type,
        const char *domain,
        AvahiLookupResultFlags flags,
        void *userdata);

    BonjourMDNSClientAvahi &client;
    const std::string serviceType;
    const BonjourMDNSClient::StateChangeHandler handler;
    AvahiServiceBrowser *browser;
};

/***********************************************************************
 * Resolve request: SRV and TXT first, then every A and AAAA record
 **********************************************************************/
class BonjourServiceResolverAvahi : public BonjourServiceResolver
{
public:
    BonjourServiceResolverAvahi(AvahiClient *client, const int ifIndex, const BonjourMDNSClient::ResolveHandler &handler):
        client(client),
        ifIndex(ifIndex),
        handler(handler),
        resolver(nullptr),
        aBrowser(nullptr),
        aaaaBrowser(nullptr),
        aFound(false),
        aaaaFound(false),
        done(false)
    {
        return;
    }

    ~BonjourServiceResolverAvahi(void)
    {
        this->cancel();
    }

    void cancel(void)
    {
        if (resolver != nullptr) avahi_service_resolver_free(resolver);
        resolver = nullptr;
        if (aBrowser != nullptr) avahi_record_browser_free(aBrowser);
        aBrowser = nullptr;
        if (aaaaBrowser != nullptr) avahi_record_browser_free(aaaaBrowser);
        aaaaBrowser = nullptr;
        done = true;
    }

    void lookupAddresses(const char *hostName, const BonjourServiceRecord &record);

    void finish(const bool found);

    static void resolverCallback(
        AvahiServiceResolver *r,
        AvahiIfIndex interface,
        AvahiProtocol protocol,
        AvahiResolverEvent event,
        const char *name,
        const char *type,
        const char *domain,
        const char *host_name,
        const AvahiAddress *address,
        uint16_t port,
        AvahiStringList *txt,
        AvahiLookupResultFlags flags,
        void *userdata);

    static void recordCallback(
        AvahiRecordBrowser *b,
        AvahiIfIndex interface,
        AvahiProtocol protocol,
        AvahiBrowserEvent event,
        const char *name,
        uint16_t clazz,
        uint16_t type,
        const void *rdata,
        size_t size,
        AvahiLookupResultFlags flags,
        void *userdata);

    AvahiClient *client;
    const int ifIndex;
    const BonjourMDNSClient::ResolveHandler handler;
    AvahiServiceResolver *resolver;
    AvahiRecordBrowser *aBrowser;
    AvahiRecordBrowser *aaaaBrowser;
    bool aFound;
    bool aaaaFound;
    bool done;
    BonjourAddressCollector collector;
};

/***********************************************************************
 * Client bound to one interface
 **********************************************************************/
class BonjourMDNSClientAvahi : public BonjourMDNSClient
{
public:
    BonjourMDNSClientAvahi(BonjourEventLoop &loop, const std::string &ifAddr):
        ifAddr(ifAddr),
        ifIndex(lookupBonjourIfIndex(ifAddr)),
        protocol(ifAddrToAvahiProtocol(ifAddr)),
        client(nullptr)
    {
        if (ifIndex == BONJOUR_SCAN_IF_UNSPEC)
        {
            SoapySDR::logf(SOAPY_SDR_WARNING, "BonjourMDNS: no interface for %s, skipping", ifAddr.c_str());
            return;
        }

        const auto poll = loop.getPoll();
        if (poll == nullptr) return;

        int error(0);
        client = avahi_client_new(poll, AVAHI_CLIENT_NO_FAIL, &BonjourMDNSClientAvahi::clientCallback, this, &error);
        if (client == nullptr or error != 0)
        {
            SoapySDR::logf(SOAPY_SDR_ERROR, "avahi_client_new() failed: %s", avahi_strerror(error));
            return;
        }
        SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourMDNS bound to %s (if %d) IPv%d",
            ifAddr.c_str(), ifIndex, avahiProtocolToIpVer(protocol));
    }

    ~BonjourMDNSClientAvahi(void)
    {
        this->close();
    }

    bool status(void)
    {
        if (client == nullptr) return false;
        return avahi_client_get_state(client) != AVAHI_CLIENT_FAILURE;
    }

    std::unique_ptr<BonjourServiceBrowser> browse(const std::string &serviceType, const StateChangeHandler &handler)
    {
        if (client == nullptr) return std::unique_ptr<BonjourServiceBrowser>();

        std::string type, domain;
        splitBonjourServiceType(serviceType, type, domain);

        std::unique_ptr<BonjourServiceBrowserAvahi> browser(new BonjourServiceBrowserAvahi(*this, serviceType, handler));
        browser->browser = avahi_service_browser_new(
            client,
            ifIndex,
            protocol,
            type.c_str(),
            domain.empty()?nullptr:domain.c_str(),
            AvahiLookupFlags(0),
            &BonjourServiceBrowserAvahi::browserCallback,
            browser.get());

        if (browser->browser == nullptr)
        {
            SoapySDR::logf(SOAPY_SDR_ERROR, "avahi_service_browser_new(%s) failed: %s",
                serviceType.c_str(), avahi_strerror(avahi_client_errno(client)));
            return std::unique_ptr<BonjourServiceBrowser>();
        }
        return std::unique_ptr<BonjourServiceBrowser>(browser.release());
    }

    std::unique_ptr<BonjourServiceResolver> resolve(const std::string &serviceType, const std::string &name, const ResolveHandler &handler)
    {
        if (client == nullptr) return std::unique_ptr<BonjourServiceResolver>();

        std::string type, domain;
        splitBonjourServiceType(serviceType, type, domain);

        std::unique_ptr<BonjourServiceResolverAvahi> resolver(new BonjourServiceResolverAvahi(client, ifIndex, handler));
        resolver->resolver = avahi_service_resolver_new(
            client,
            ifIndex,
            protocol,
            name.c_str(),
            type.c_str(),
            domain.empty()?nullptr:domain.c_str(),
            AVAHI_PROTO_UNSPEC, //the address lookups below cover both versions
            AvahiLookupFlags(0),
            &BonjourServiceResolverAvahi::resolverCallback,
            resolver.get());

        if (resolver->resolver == nullptr)
        {
            SoapySDR::logf(SOAPY_SDR_ERROR, "avahi_service_resolver_new(%s) failed: %s",
                name.c_str(), avahi_strerror(avahi_client_errno(client)));
            return std::unique_ptr<BonjourServiceResolver>();
        }
        return std::unique_ptr<BonjourServiceResolver>(resolver.release());
    }

    void close(void)
    {
        if (client == nullptr) return;
        avahi_client_free(client);
        client = nullptr;
        SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourMDNS closed client on %s", ifAddr.c_str());
    }

    static void clientCallback(AvahiClient *c, AvahiClientState state, void *userdata)
    {
        auto self = (BonjourMDNSClientAvahi*)userdata;
        switch (state)
        {
        case AVAHI_CLIENT_S_RUNNING: //success
            SoapySDR::logf(SOAPY_SDR_DEBUG, "Avahi client running on %s...", self->ifAddr.c_str());
            break;

        case AVAHI_CLIENT_FAILURE: //error
            SoapySDR::logf(SOAPY_SDR_ERROR, "Avahi client failure on %s: %s",
                self->ifAddr.c_str(), avahi_strerror(avahi_client_errno(c)));
            break;

        case AVAHI_CLIENT_S_COLLISION:
        case AVAHI_CLIENT_S_REGISTERING:
        case AVAHI_CLIENT_CONNECTING:
            break;
        }
    }

    const std::string ifAddr;
    const int ifIndex;
    const AvahiProtocol protocol;
    AvahiClient *client;
};

void BonjourServiceBrowserAvahi::browserCallback(
    AvahiServiceBrowser *b,
    AvahiIfIndex /*interface*/,
    AvahiProtocol protocol,
    AvahiBrowserEvent event,
    const char *name,
    const char *type,
    const char *domain,
    AvahiLookupResultFlags /*flags*/,
    void *userdata)
{
    auto self = (BonjourServiceBrowserAvahi*)userdata;
    auto c = avahi_service_browser_get_client(b);

    switch (event) {
    case AVAHI_BROWSER_FAILURE:
        SoapySDR::logf(SOAPY_SDR_ERROR, "Avahi browser error on %s: %s",
            self->client.ifAddr.c_str(), avahi_strerror(avahi_client_errno(c)));
        return;

    case AVAHI_BROWSER_NEW:
        SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourMDNS found %s.%s.%s IPv%d", name, type, domain, avahiProtocolToIpVer(protocol));
        self->handler(self->client, self->serviceType, name, BONJOUR_SERVICE_ADDED);
        break;

    case AVAHI_BROWSER_REMOVE:
        self->handler(self->client, self->serviceType, name, BONJOUR_SERVICE_REMOVED);
        break;

    case AVAHI_BROWSER_ALL_FOR_NOW:
    case AVAHI_BROWSER_CACHE_EXHAUSTED:
        break;
    }
}

void BonjourServiceResolverAvahi::resolverCallback(
    AvahiServiceResolver *r,
    AvahiIfIndex /*interface*/,
    AvahiProtocol protocol,
    AvahiResolverEvent event,
    const char *name,
    const char *type,
    const char *domain,
    const char *host_name,
    const AvahiAddress *address,
    uint16_t port,
    AvahiStringList *txt,
    AvahiLookupResultFlags /*flags*/,
    void *userdata)
{
    auto self = (BonjourServiceResolverAvahi*)userdata;
    const bool found = (event == AVAHI_RESOLVER_FOUND and address != nullptr and host_name != nullptr);

    BonjourServiceRecord record;
    if (found)
    {
        char addrStr[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(addrStr, sizeof(addrStr), address);
        if (address->proto == AVAHI_PROTO_INET6) record.ipv6.push_back(addrStr);
        else record.ipv4.push_back(addrStr);
        record.properties = bonjourTxtToProperties(txt);
        record.port = port;
    }
    else SoapySDR::logf(SOAPY_SDR_DEBUG, "BonjourMDNS resolver failed: %s.%s.%s IPv%d",
        name, type, domain, avahiProtocolToIpVer(protocol));

    //the service resolver is done either way
    const std::string hostName(found?host_name:"");
    avahi_service_resolver_free(r);
    self->resolver = nullptr;

    if (found) self->lookupAddresses(hostName.c_str(), record);
    else self->finish(false);
}

void BonjourServiceResolverAvahi::lookupAddresses(const char *hostName, const BonjourServiceRecord &record)
{
    //the host may announce several addresses of either version
    aBrowser = avahi_record_browser_new(client, ifIndex, AVAHI_PROTO_UNSPEC, hostName,
        AVAHI_DNS_CLASS_IN, AVAHI_DNS_TYPE_A, AvahiLookupFlags(0),
        &BonjourServiceResolverAvahi::recordCallback, this);
    aaaaBrowser = avahi_record_browser_new(client, ifIndex, AVAHI_PROTO_UNSPEC, hostName,
        AVAHI_DNS_CLASS_IN, AVAHI_DNS_TYPE_AAAA, AvahiLookupFlags(0),
        &BonjourServiceResolverAvahi::recordCallback, this);

    if (aBrowser == nullptr or aaaaBrowser == nullptr)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "avahi_record_browser_new(%s) failed: %s",
            hostName, avahi_strerror(avahi_client_errno(client)));
    }

    collector.begin(record, size_t(aBrowser != nullptr) + size_t(aaaaBrowser != nullptr));
    if (collector.complete()) this->finish(true);
}

void BonjourServiceResolverAvahi::finish(const bool found)
{
    if (done) return;
    done = true;

    //the handler may delete this resolver
    auto handler = this->handler;
    const auto record = collector.getRecord();
    handler(found, record);
}

void BonjourServiceResolverAvahi::recordCallback(
    AvahiRecordBrowser *b,
    AvahiIfIndex /*interface*/,
    AvahiProtocol /*protocol*/,
    AvahiBrowserEvent event,
    const char *name,
    uint16_t /*clazz*/,
    uint16_t type,
    const void *rdata,
    size_t size,
    AvahiLookupResultFlags /*flags*/,
    void *userdata)
{
    auto self = (BonjourServiceResolverAvahi*)userdata;
    bool &recordFound = (b == self->aBrowser)? self->aFound : self->aaaaFound;

    if (event == AVAHI_BROWSER_NEW)
    {
        if (self->collector.addRData(type, rdata, size)) recordFound = true;
        return;
    }
    if (event == AVAHI_BROWSER_REMOVE) return;

    //the cache answer is enough once it held a record,
    //otherwise wait for the network answer
    if (event == AVAHI_BROWSER_CACHE_EXHAUSTED and not recordFound) return;
    if (event == AVAHI_BROWSER_FAILURE)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "Avahi record browser error for %s: %s",
            name, avahi_strerror(avahi_client_errno(avahi_record_browser_get_client(b))));
    }

    //this lookup is done
    if (b == self->aBrowser) self->aBrowser = nullptr;
    else if (b == self->aaaaBrowser) self->aaaaBrowser = nullptr;
    else return;
    avahi_record_browser_free(b);

    if (self->collector.finishLookup()) self->finish(true);
}

std::unique_ptr<BonjourMDNSClient> BonjourMDNSClient::makeAvahi(BonjourEventLoop &loop, const std::string &ifAddr)
{
    return std::unique_ptr<BonjourMDNSClient>(new BonjourMDNSClientAvahi(loop, ifAddr));
}
