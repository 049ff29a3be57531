#define GOPT_IMPLEMENTATION
#include "gopt.hpp"
#include <format>
#include <iostream>
#include <string>
#include <vector>

// A function-style routine: it owns its usage text and optstring, and returns
// gopt::USAGE_ERROR straight back to its caller on a bad invocation.
static int copy_files(const std::vector<std::string>& args)
{
    const std::string usage = "copy [-v] [-n] [-0] [-m MODE] [-o DIR] SRC [DST]";

    // 1. Compile
    // v, n, 0: flags ("0" / "1"); m, o: valued ("" when absent)
    // one or two positionals
    auto plan = gopt::compile("vn0m:o:", "1", "2");

    // 2. Parse
    auto res = plan.run(args, std::cerr, usage);
    if (!res) return res.error().status;

    // 3. Use Values
    bool verbose = res->flag('v');
    bool dry_run = res->flag('n');
    const std::string& mode = res->value('m');
    const std::string& out_dir = res->value('o');
    const auto& pos_args = res->positionals();

    if (verbose)
        std::cout << "[Verbose Mode Enabled]\n";

    std::cout << "Dry run:   " << (dry_run ? "yes" : "no") << "\n";
    std::cout << "NUL delim: " << (res->flag('0') ? "yes" : "no") << "\n";
    std::cout << "Mode:      " << (mode.empty() ? "(default)" : mode) << "\n";
    std::cout << "Out dir:   " << (out_dir.empty() ? "(cwd)" : out_dir) << "\n";

    std::cout << "Positional Args: ";
    for (const auto& p : pos_args) std::cout << "'" << p << "' ";
    std::cout << "\n";

    return 0;
}

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    // Typed equivalent of "vn0m:o:" with the same bounds, shown for --debug-plan
    gopt::Schema schema;
    schema.flag('v').flag('n').flag('0').valued('m').valued('o').min_args(1).max_args(2);

    if (!args.empty() && args.front() == "--debug-plan")
    {
        std::cout << std::format("{}\n", schema.compile());
        return 0;
    }

    return copy_files(args);
}
