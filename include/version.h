#pragma once

#define PLEXWATCH_VERSION_MAJOR 1
#define PLEXWATCH_VERSION_MINOR 0
#define PLEXWATCH_VERSION_PATCH 0

#define PLEXWATCH_STRINGIFY(x) #x
#define PLEXWATCH_TOSTRING(x) PLEXWATCH_STRINGIFY(x)

// "MAJOR.MINOR.PATCH"
#define PLEXWATCH_VERSION_STRING                                          \
  PLEXWATCH_TOSTRING(PLEXWATCH_VERSION_MAJOR) "."                         \
  PLEXWATCH_TOSTRING(PLEXWATCH_VERSION_MINOR) "."                         \
  PLEXWATCH_TOSTRING(PLEXWATCH_VERSION_PATCH)
