// bench/main.cpp - benchmark entry point
// nanobench needs implementation defined in exactly one translation unit

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

#include "mfdlink/log.hpp"

// nanobench has no auto-registration, each file exposes a runner called from here
namespace bench
{
    void run_output_benchmarks();
    void run_classification_benchmarks();
} // namespace bench

int main()
{
    mfdlink::log::set_level(mfdlink::log::level::off);

    bench::run_output_benchmarks();
    bench::run_classification_benchmarks();
    return 0;
}
