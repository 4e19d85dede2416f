/*
 * Fallback version header for dlcore
 *
 * The build generates generated/dlcore/version.hpp from cmake/version.hpp.in and
 * places it ahead of include/ on the include path. This copy only keeps the
 * sources compiling when that header is absent.
 */

#pragma once

#ifndef DLCORE_VERSION_MAJOR
#define DLCORE_VERSION_MAJOR 0
#endif

#ifndef DLCORE_VERSION_MINOR
#define DLCORE_VERSION_MINOR 0
#endif

#ifndef DLCORE_VERSION_PATCH
#define DLCORE_VERSION_PATCH 0
#endif

#ifndef DLCORE_VERSION_STRING
#define DLCORE_VERSION_STRING "0.0.0+dev"
#endif
