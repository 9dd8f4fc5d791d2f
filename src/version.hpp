#pragma once

// Build/version info.
//
// CMake defines DELVE_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef DELVE_VERSION
#define DELVE_VERSION "dev"
#endif

#ifndef DELVE_APPNAME
#define DELVE_APPNAME "Delve"
#endif
