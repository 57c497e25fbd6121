// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "BonjourConfig.hpp"
#include "BonjourScanDefs.hpp"
#include <SoapySDR/Logger.hpp>
#include <stdexcept>
#include <climits>
#include <cmath>

BonjourConfig::BonjourConfig(void):
    timeoutUs(BONJOUR_SCAN_DEFAULT_TIMEOUT_US),
    resolveTimeoutUs(BONJOUR_SCAN_RESOLVE_TIMEOUT_US),
    zoneStyle(BONJOUR_SCAN_DEFAULT_ZONE_STYLE)
{
    return;
}

const BonjourConfig &BonjourConfig::getDefault(void)
{
    static const BonjourConfig config;
    return config;
}

static void parseTimeout(const SoapySDR::Kwargs &args, const std::string &key, long &timeoutUs)
{
    const auto it = args.find(key);
    if (it == args.end()) return;
    try
    {
        const long value = std::stol(it->second);
        if (value < 0) throw std::out_of_range("negative timeout");
        timeoutUs = value;
    }
    catch (const std::exception &ex)
    {
        SoapySDR::logf(SOAPY_SDR_WARNING, "BonjourConfig: ignoring %s=%s (%s)", key.c_str(), it->second.c_str(), ex.what());
    }
}

BonjourConfig BonjourConfig::fromKwargs(const SoapySDR::Kwargs &args)
{
    BonjourConfig config(BonjourConfig::getDefault());

    parseTimeout(args, BONJOUR_SCAN_KWARG_TIMEOUT, config.timeoutUs);
    parseTimeout(args, BONJOUR_SCAN_KWARG_RESOLVE_TIMEOUT, config.resolveTimeoutUs);

    const auto zoneIt = args.find(BONJOUR_SCAN_KWARG_ZONE);
    if (zoneIt != args.end())
    {
        if (zoneIt->second == "name") config.zoneStyle = BONJOUR_SCAN_ZONE_NAME;
        else if (zoneIt->second == "index") config.zoneStyle = BONJOUR_SCAN_ZONE_INDEX;
        else SoapySDR::logf(SOAPY_SDR_WARNING, "BonjourConfig: unknown zone style '%s'", zoneIt->second.c_str());
    }

    return config;
}

BonjourConfig BonjourConfig::fromString(const std::string &markup)
{
    return BonjourConfig::fromKwargs(SoapySDR::KwargsFromString(markup));
}

long BonjourConfig::timeoutFromSeconds(const std::string &seconds)
{
    const double value = std::stod(seconds)*1e6;
    if (std::isnan(value) or value < 0.0 or value >= double(LONG_MAX))
    {
        throw std::out_of_range("timeout out of range: " + seconds);
    }
    return long(value);
}
