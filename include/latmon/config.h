#ifndef LATMON_CONFIG_H_
#define LATMON_CONFIG_H_

// Project version
#define LATMON_VERSION_MAJOR 1
#define LATMON_VERSION_MINOR 0
#define LATMON_VERSION_PATCH 0
#define LATMON_VERSION "1.0.0"

// Defaults shared by the daemon and the config loader
#define LATMON_DEFAULT_CONFIG_PATH "latmon.json"
#define LATMON_DEFAULT_HTTP_PORT 3030

#endif // LATMON_CONFIG_H_
