#ifndef __MS_TEST_HEADERS__
#define __MS_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __MS_TEST_HEADERS__
