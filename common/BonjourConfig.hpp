// Copyright (c) 2026-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "BonjourScanConfig.hpp"
#include <SoapySDR/Types.hpp>
#include <string>

/*!
 * Discovery settings.
 * The defaults depend on the platform and are resolved once,
 * then handed to the discovery engine rather than checked at call sites.
 */
struct BONJOUR_SCAN_API BonjourConfig
{
    //! Create a config with the platform defaults
    BonjourConfig(void);

    long timeoutUs; //! Time to wait on all interfaces
    long resolveTimeoutUs; //! Bound on one resolve request
    int zoneStyle; //! BONJOUR_SCAN_ZONE_NAME or BONJOUR_SCAN_ZONE_INDEX

    //! The process-wide platform defaults
    static const BonjourConfig &getDefault(void);

    /*!
     * Apply overrides on top of the defaults.
     * Malformed values are logged and the default is kept.
     * Example: "timeout=2000000, zone=index"
     */
    static BonjourConfig fromKwargs(const SoapySDR::Kwargs &args);

    //! Parse markup and apply overrides
    static BonjourConfig fromString(const std::string &markup);

    /*!
     * Convert a user supplied wait in seconds to microseconds.
     * \throws std::invalid_argument when not a number
     * \throws std::out_of_range when negative or not representable
     */
    static long timeoutFromSeconds(const std::string &seconds);
};
