#include <iostream>
#include <vector>
#include <string>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include "cli/minsub_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    minsub build "
              << theme::color::RESET << theme::color::BROWN << "[job.yaml] [--yaml]"
              << theme::color::RESET << theme::color::DIM
              << "   Print the pipelines request" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    minsub check "
              << theme::color::RESET << theme::color::BROWN << "[job.yaml]"
              << theme::color::RESET << theme::color::DIM
              << "            Validate a job file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    minsub --version        Show version\n"
              << "    minsub --help           Show this help\n\n"
              << "    The job file defaults to ./" << JOB_FILE_NAME << "; global defaults are read\n"
              << "    from " << get_global_config_path().string()
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        MinsubCLI cli;

        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        bool yaml_output = false;
        std::string job_arg;
        for (const auto& a : args) {
            if (a == "--yaml") {
                yaml_output = true;
            } else if (job_arg.empty()) {
                job_arg = a;
            } else {
                std::cerr << theme::fail("Unexpected argument: " + a);
                return 1;
            }
        }
        std::filesystem::path job_path = job_arg.empty()
            ? get_job_config_path(platform::current_dir())
            : std::filesystem::path(job_arg);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "minsub"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << MINSUB_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "build") {
            return cli.run_build(job_path, yaml_output);
        } else if (cmd == "check") {
            return cli.run_check(job_path);
        } else {
            std::cerr << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
