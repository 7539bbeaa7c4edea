#pragma once

// Normally injected by CMake from the project version
#ifndef ISSUE_SPLITTER_VERSION_STRING
#define ISSUE_SPLITTER_VERSION_STRING "0.1.0"
#endif
