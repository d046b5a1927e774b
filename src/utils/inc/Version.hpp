#pragma once

// Overridden by the build with the project version
#ifndef BOLTSQL_VERSION
#define BOLTSQL_VERSION "0.1.0"
#endif
