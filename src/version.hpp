#pragma once

// Normally provided by the build from project(VERSION)
#ifndef MAGICLOC_VERSION
#define MAGICLOC_VERSION "0.0.0-dev"
#endif

#define BUILD_DATE __DATE__
#define BUILD_TIME __TIME__
