// samud unit tests. Run: samud_tests [doctest options]
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
