#include <iostream>
#include <vector>
#include <string>
#include "cli/args.hpp"
#include "cli/runner_cli.hpp"
#include "cli/theme.hpp"
#include "core/interrupt.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        auto parsed = parse_args(args);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            std::cout << usage_text();
            return EXIT_USAGE;
        }

        if (parsed.value.show_help) {
            std::cout << usage_text();
            return EXIT_OK;
        }
        if (parsed.value.show_version) {
            std::cout << theme::color::CYAN << theme::color::BOLD << "netrun"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << NETRUN_VERSION << theme::color::RESET << "\n";
            return EXIT_OK;
        }

        static InterruptFlag interrupt;
        install_interrupt_handler(interrupt);

        RunnerCLI cli(interrupt);
        return cli.run(parsed.value);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_FAILED;
    }
}
