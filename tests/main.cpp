// tests/main.cpp - test runner entry point
// doctest needs its implementation defined in exactly one translation unit

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "mfdlink/log.hpp"

int main(int argc, char **argv)
{
    // failure paths log on purpose, keep the report readable
    mfdlink::log::set_level(mfdlink::log::level::off);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
