#pragma once

#include <ostream>

// lockpat [size=3] [min_length=4]
// env: VERBOSE REPORT=<n> LIMIT=<n> NAIVE RAW LENGTHS
// returns the exit code: 0 ok, 1 overflow, 2 bad arguments
int run(int argc, const char *const argv[], std::ostream &out, std::ostream &err);
