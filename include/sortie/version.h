// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The build passes SORTIE_VERSION_* as compile definitions; these are the fallbacks.
#ifndef SORTIE_VERSION_MAJOR
#define SORTIE_VERSION_MAJOR 0
#endif

#ifndef SORTIE_VERSION_MINOR
#define SORTIE_VERSION_MINOR 1
#endif

#ifndef SORTIE_VERSION_PATCH
#define SORTIE_VERSION_PATCH 0
#endif

#ifndef SORTIE_VERSION_STRING
#define SORTIE_VERSION_STRING "0.1.0+dev"
#endif

#ifndef SORTIE_BUILD_DATE
#define SORTIE_BUILD_DATE __DATE__ " " __TIME__
#endif

#define SORTIE_VERSION_LONG_STRING SORTIE_VERSION_STRING " (built: " SORTIE_BUILD_DATE ")"

namespace sortie::version {
constexpr int major_v = SORTIE_VERSION_MAJOR;
constexpr int minor_v = SORTIE_VERSION_MINOR;
constexpr int patch_v = SORTIE_VERSION_PATCH;
constexpr const char* string_v = SORTIE_VERSION_STRING;
constexpr const char* long_string_v = SORTIE_VERSION_LONG_STRING;
} // namespace sortie::version
