#include <iostream>
#include <vector>
#include <string>
#include "cli/args.hpp"
#include "cli/reauth_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.error);
        std::cerr << theme::dim("  Try 'aspect-reauth --help'.") << "\n";
        return 2;
    }
    if (parsed.value.show_help) {
        print_usage();
        return 0;
    }
    if (parsed.value.show_version) {
        std::cout << theme::bold("aspect-reauth")
                  << theme::dim(" version " ASPECT_REAUTH_VERSION) << "\n";
        return 0;
    }

    try {
        ReauthCLI cli(std::move(parsed.value));
        return cli.execute();
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
