#include <dply/cli/dispatch_main.hpp>
#include <dply/cli/error_handler.hpp>
#include <dply/cli/options.hpp>
#include <dply/util/env.hpp>
#include <dply/util/log.hpp>
#include <dply/util/signal.hpp>

#include <debate/argument_parser.hpp>

#include <clocale>
#include <iostream>
#include <locale>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void use_environment_locale() {
    auto lang = dply::getenv("LANG");
    if (!lang) {
        return;
    }
    try {
        std::locale::global(std::locale(*lang));
    } catch (const std::runtime_error& e) {
        dply_log(debug, "Ignoring unknown locale '{}': {}", *lang, e.what());
    }
}

}  // namespace

int main(int argc, char** argv) {
    dply::log::init_logger();
    use_environment_locale();
    std::setlocale(LC_CTYPE, ".utf8");

    dply::cli::options      opts;
    debate::argument_parser parser;
    opts.setup_parser(parser);

    std::vector<std::string> args{argv + 1, argv + argc};
    if (auto early_exit = dply::parse_command_line(parser, argv[0], args, std::cout, std::cerr)) {
        return *early_exit;
    }

    // Cancellation is cooperative: the first ^C lets in-flight files finish
    dply::install_signal_handlers();
    dply::log::current_log_level = opts.log_level;
    return dply::cli::dispatch_main(opts);
}
