// bench/bench_output.cpp - command output splitting and fault classification

#include "mfdlink/command_session.hpp"
#include "mfdlink/libssh_driver.hpp"
#include "mfdlink/transport_session.hpp"

#include <fmt/format.h>
#include <nanobench.h>
#include <string>
#include <vector>

namespace bench
{

    namespace
    {

        // what a pty hands back: CRLF line endings
        [[nodiscard]] auto make_output(std::size_t const lines) -> std::string
        {
            std::string out;
            for (std::size_t i = 0; i < lines; ++i)
            {
                out += fmt::format("2024-05-01T12:00:{:02} navd[{}]: heading 271.{} deg\r\n", i % 60, 400 + i, i % 10);
            }
            return out;
        }

    } // anonymous namespace

    void run_output_benchmarks()
    {
        using namespace ankerl::nanobench;

        for (std::size_t const lines : {1UZ, 64UZ, 4096UZ})
        {
            auto const output = make_output(lines);
            Bench().batch(output.size()).unit("byte").run(fmt::format("SplitOutput_{}_lines", lines), [&] {
                auto split = mfdlink::ssh::split_output_lines(output);
                doNotOptimizeAway(split);
            });
        }
    }

    void run_classification_benchmarks()
    {
        using namespace ankerl::nanobench;

        std::vector<std::string> const messages{
            "Failed to connect: Network is unreachable",
            "Timeout connecting to 192.168.1.20",
            "kex error : no match for method server host key algo",
            "Access denied. Authentication that can continue: publickey",
        };

        Bench().batch(messages.size()).run("ClassifyLibsshError", [&] {
            for (auto const &msg : messages)
            {
                auto f = mfdlink::ssh::classify_libssh_error(msg);
                doNotOptimizeAway(f);
            }
        });

        Bench().run("ClassifyAndMapFault", [&] {
            auto const f = mfdlink::ssh::classify_libssh_error(messages.front());
            auto kind = mfdlink::ssh::exhausted_error_kind(f);
            doNotOptimizeAway(kind);
        });
    }

} // namespace bench
