#pragma once

// Build/version info.
//
// CMake defines PROCTEX_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef PROCTEX_VERSION
#define PROCTEX_VERSION "dev"
#endif

#ifndef PROCTEX_APPNAME
#define PROCTEX_APPNAME "ProcTex"
#endif
