#pragma once

#define HARNESS_VERSION_MAJOR 0
#define HARNESS_VERSION_MINOR 3
#define HARNESS_VERSION_PATCH 0

#define HARNESS_VERSION_STRING "0.3.0"
