#pragma once
// Version information for smriti
// Single source of truth for version numbers

#define SMRITI_VERSION "0.4.1"
#define SMRITI_VERSION_MAJOR 0
#define SMRITI_VERSION_MINOR 4
#define SMRITI_VERSION_PATCH 1
