// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include <fstream>

#include "AllocationRun.h"
#include "arealloc.h"
#include "settingsnode.h"
#include "settingsnode/inner.h"
#include "settingsnode/yaml.h"
#include "version.h"

namespace arealloc {

struct Info {
    static const char* const text;
};

}  // namespace arealloc

static void print_usage(const char* program_name) {
    std::cerr << "Arealloc areal and categorical allocation engine\n"
                 "Version: "
              << arealloc::Version::version
              << "\n\n"
                 "Usage:   "
              << program_name
              << " (<option> | <settingsfile> | -)\n"
                 "Options:\n"
                 "  -h, --help     Print this help text\n"
                 "  -i, --info     Print further information\n"
                 "  -v, --version  Print version\n"
                 "\n"
                 "Exit codes:\n"
                 "  1    invalid invocation\n"
                 "  3    input integrity error\n"
                 "  4    conservation violated under strict validation\n"
                 "  255  any other error"
              << std::endl;
}

static void run_settings(std::istream& in) {
    arealloc::AllocationRun run(settings::SettingsNode(std::make_unique<settings::YAML>(in)));
    run.run();
}

auto main(int argc, char* argv[]) -> int {
    if (argc != 2) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string arg = argv[1];
    if (arg.length() > 1 && arg[0] == '-') {
        if (arg == "--version" || arg == "-v") {
            std::cout << arealloc::Version::version << std::endl;
        } else if (arg == "--info" || arg == "-i") {
            std::cout << "Version:                " << arealloc::Version::version << "\n\n"
                      << arealloc::Info::text
                      << "\n"
                         "Options:                ";
            bool first = true;
            for (const auto& option : arealloc::Options::options) {
                if (first) {
                    first = false;
                } else {
                    std::cout << "                        ";
                }
                std::cout << option.name << " = " << (option.value ? "true" : "false") << "\n";
            }
            std::cout << std::flush;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
        } else {
            print_usage(argv[0]);
            return 1;
        }
    } else {
        try {
            if (arg == "-") {
                std::cin >> std::noskipws;
                run_settings(std::cin);
            } else {
                std::ifstream settings_file(arg);
                if (!settings_file) {
                    throw std::runtime_error("Cannot open " + arg);
                }
                run_settings(settings_file);
            }
        } catch (const arealloc::integrity_error& ex) {
            std::cerr << ex.what() << std::endl;
            return 3;
        } catch (const arealloc::conservation_error& ex) {
            std::cerr << ex.what() << "\n" << ex.violations() << " conservation violations" << std::endl;
            return 4;
        } catch (const std::exception& ex) {
            std::cerr << ex.what() << std::endl;
            return 255;
        }
    }
    return 0;
}
