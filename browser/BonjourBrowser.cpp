// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourScanDefs.hpp"
#include "BonjourConfig.hpp"
#include "BonjourDiscovery.hpp"
#include "BonjourServices.hpp"
#include <SoapySDR/Logger.hpp>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <getopt.h>

/***********************************************************************
 * Print help message
 **********************************************************************/
static int printHelp(void)
{
    std::cout << "Usage BonjourBrowser [options]" << std::endl;
    std::cout << "  Options summary:" << std::endl;
    std::cout << "    --help \t\t\t\t Print this help message" << std::endl;
    std::cout << "    --remoted \t\t\t\t Scan IPv6 for " << BONJOUR_SCAN_REMOTED_SERVICE << std::endl;
    std::cout << "    --mobdev2 \t\t\t\t Scan IPv4 for " << BONJOUR_SCAN_MOBDEV2_SERVICE << std::endl;
    std::cout << "    --pairing \t\t\t\t Scan IPv4 for " << BONJOUR_SCAN_REMOTEPAIRING_SERVICE << std::endl;
    std::cout << "    --service=TYPE \t\t\t Scan for a custom service type" << std::endl;
    std::cout << "    --ipver=4|6 \t\t\t IP version for --service (default 4)" << std::endl;
    std::cout << "    --timeout=SECONDS \t\t\t Time to wait for answers" << std::endl;
    std::cout << "    --args=KWARGS \t\t\t Discovery settings markup" << std::endl;
    std::cout << "    --debug \t\t\t\t Enable debug logging" << std::endl;
    std::cout << std::endl;
    return EXIT_SUCCESS;
}

/***********************************************************************
 * Run the scan and print the answers
 **********************************************************************/
static int runScan(BonjourDiscovery &discovery, const std::string &service, const int ipVer, const long timeoutUs)
{
    std::cout << "Browsing " << service << " over IPv" << ipVer
        << " for " << (timeoutUs/1e6) << " seconds..." << std::endl;

    const auto answers = (ipVer == BONJOUR_SCAN_IPVER_INET6)?
        BonjourServices::browseIPv6(discovery, service, timeoutUs):
        BonjourServices::browseIPv4(discovery, service, timeoutUs);

    for (const auto &answer : answers)
    {
        std::cout << "  " << answer.toString() << std::endl;
    }
    std::cout << "Found " << answers.size() << " answer(s)" << std::endl;
    return EXIT_SUCCESS;
}

/***********************************************************************
 * Parse and dispatch options
 **********************************************************************/
int main(int argc, char *argv[])
{
    static struct option long_options[] = {
        {"help", no_argument, 0, 'h'},
        {"remoted", no_argument, 0, 'r'},
        {"mobdev2", no_argument, 0, 'm'},
        {"pairing", no_argument, 0, 'p'},
        {"service", required_argument, 0, 's'},
        {"ipver", required_argument, 0, 'i'},
        {"timeout", required_argument, 0, 't'},
        {"args", required_argument, 0, 'a'},
        {"debug", no_argument, 0, 'd'},
        {0, 0, 0,  0}
    };

    std::string service;
    int ipVer(BONJOUR_SCAN_IPVER_INET);
    std::string timeoutArg;
    std::string kwargs;

    int long_index = 0;
    int option = 0;
    while ((option = getopt_long_only(argc, argv, "", long_options, &long_index)) != -1)
    {
        switch (option)
        {
        case 'h': return printHelp();
        case 'r': service = BONJOUR_SCAN_REMOTED_SERVICE; ipVer = BONJOUR_SCAN_IPVER_INET6; break;
        case 'm': service = BONJOUR_SCAN_MOBDEV2_SERVICE; ipVer = BONJOUR_SCAN_IPVER_INET; break;
        case 'p': service = BONJOUR_SCAN_REMOTEPAIRING_SERVICE; ipVer = BONJOUR_SCAN_IPVER_INET; break;
        case 's': service = optarg; break;
        case 'i': ipVer = std::atoi(optarg); break;
        case 't': timeoutArg = optarg; break;
        case 'a': kwargs = optarg; break;
        case 'd': SoapySDR::setLogLevel(SOAPY_SDR_DEBUG); break;
        default: return printHelp();
        }
    }

    //unknown or unspecified options, do help...
    if (service.empty()) return printHelp();
    if (ipVer != BONJOUR_SCAN_IPVER_INET and ipVer != BONJOUR_SCAN_IPVER_INET6)
    {
        std::cerr << "Unsupported IP version: " << ipVer << std::endl;
        return EXIT_FAILURE;
    }

    BonjourDiscovery discovery(BonjourConfig::fromString(kwargs));
    long timeoutUs = discovery.getConfig().timeoutUs;
    if (not timeoutArg.empty())
    {
        try
        {
            timeoutUs = BonjourConfig::timeoutFromSeconds(timeoutArg);
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Bad timeout " << timeoutArg << ": " << ex.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    return runScan(discovery, service, ipVer, timeoutUs);
}
