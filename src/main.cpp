#include <chrono>
#include <iostream>
#include <string>
#include "cli/repl.hpp"
#include "cli/terminal.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <ssh/libssh2_transport.hpp>
#include <ssh/session.hpp>

void print_usage() {
    std::cout << theme::banner(SEACMD_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    seacmd"
              << theme::color::RESET << theme::color::DIM
              << "                  Start the interactive terminal" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    seacmd -c "
              << theme::color::RESET << theme::color::BROWN << "\"<line>\""
              << theme::color::RESET << theme::color::DIM
              << "      Run one command and exit" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    seacmd --version        Show version\n"
              << "    seacmd --help           Show this help\n\n"
              << "    Settings: " << get_config_path().string()
              << theme::color::RESET << "\n\n";
}

// Run a single line to completion and print what it produced.
static int run_once(Terminal& term, const std::string& line) {
    term.submit_line(line);
    const auto& t = term.config().timeouts();
    auto limit = std::chrono::seconds(t.connect + t.stream + 5);
    if (!term.run_until_idle(std::chrono::duration_cast<std::chrono::milliseconds>(limit))) {
        std::cout << theme::fail("Timed out waiting for the command to finish.");
        return 1;
    }
    print_transcript(term.transcript());
    return term.last_failed() ? 1 : 0;
}

int main(int argc, char** argv) {
    try {
        std::string one_shot;
        if (argc > 1) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "seacmd"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << SEACMD_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            } else if (cmd == "-c") {
                if (argc < 3) {
                    std::cout << theme::fail("Missing command line.");
                    std::cout << theme::step("Usage: seacmd -c \"<line>\"");
                    return 1;
                }
                one_shot = argv[2];
            } else {
                std::cout << theme::fail("Unknown option: " + cmd);
                print_usage();
                return 1;
            }
        }

        if (!config_exists()) {
            auto created = create_default_config();
            if (created.is_err()) std::cout << theme::fail(created.error);
        }

        auto config_result = Config::load();
        if (config_result.is_err()) {
            std::cout << theme::fail(config_result.error);
            return 1;
        }
        const Config& config = config_result.value;
        seacmd_log_configure(config.log().path, config.log().enabled);
        seacmd_log(std::string("seacmd ") + SEACMD_VERSION + " starting");

        Session session(libssh2_transport_factory(), SessionOptions::from_config(config));
        Terminal term(config, session);

        int rc = one_shot.empty() ? Repl(term).run() : run_once(term, one_shot);
        session.disconnect();
        return rc;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
