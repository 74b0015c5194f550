#include <iostream>
#include <string>
#include <vector>

#include "cli/cli.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

int main(int argc, char* argv[]) {
    if (argc < 3) {
        CLI::print_help(std::cerr);
        return 1;
    }
    std::string command = argv[1];
    std::vector<std::string> args(argv + 3, argv + argc);

    try {
        ClientConfig config = load_config(argv[2]);
        if (!config.log_file.empty()) {
            Logger::instance().init(config.log_file);
        }
        Logger::instance().set_min_level(config.debug ? LogLevel::DEBUG : LogLevel::WARNING);
        LOG_INFO("wzbank ", command, " against ", config.base_url);

        CLI cli(config);
        return cli.run(command, args);
    } catch (const BankError& e) {
        std::cerr << "Error (" << phase_to_string(e.phase()) << "): " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
