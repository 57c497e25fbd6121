// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include <SoapySDR/Config.hpp>

/***********************************************************************
 * API export defines
 **********************************************************************/
#ifdef BONJOUR_SCAN_DLL // defined if BonjourScan is compiled as a DLL
  #ifdef BONJOUR_SCAN_DLL_EXPORTS // defined if we are building the DLL (instead of using it)
    #define BONJOUR_SCAN_API SOAPY_SDR_HELPER_DLL_EXPORT
  #else
    #define BONJOUR_SCAN_API SOAPY_SDR_HELPER_DLL_IMPORT
  #endif // BONJOUR_SCAN_DLL_EXPORTS
#else // BONJOUR_SCAN_DLL is not defined: this means BonjourScan is a static lib.
  #define BONJOUR_SCAN_API SOAPY_SDR_HELPER_DLL_EXPORT
#endif // BONJOUR_SCAN_DLL
