#pragma once

// Build/version info.
//
// CMake defines PROCMAZE_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef PROCMAZE_VERSION
#define PROCMAZE_VERSION "dev"
#endif

#ifndef PROCMAZE_APPNAME
#define PROCMAZE_APPNAME "ProcMaze"
#endif
