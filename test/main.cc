//
// Main entry point for the doctest test runner.
// All test cases are defined in the test_*.cc files under test/<area>/.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>
