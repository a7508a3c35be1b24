#include "ProxyApp.hpp"
#include "ProxyConfig.hpp"
#include "ProxyErrors.hpp"
#include "Logging.hpp"

#include <iostream>
#include <print>

#include <boost/program_options.hpp>

#ifndef GREEDY_PROXY_VERSION
#define GREEDY_PROXY_VERSION "0.0.0"
#endif

int main(int argc, char* argv[]) {
    namespace po = boost::program_options;

    std::string config_path;

    po::options_description desc("supported options");
    desc.add_options()
        ("help,h", "print this message")
        ("version,v", "print the version")
        ("config,c", po::value<std::string>(&config_path)->default_value("config.ini"), "INI file with the proxy settings");

    po::positional_options_description positional;
    positional.add("config", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }

        if (vm.count("version")) {
            std::println("greedy-proxy {}", GREEDY_PROXY_VERSION);
            return 0;
        }
    }
    catch (const po::error& ex) {
        std::println(stderr, "{}", ex.what());
        std::cerr << desc << "\n";
        return 1;
    }

    try {
        auto cfg = load_config(config_path);
        init_logging(cfg);

        ProxyApp app(std::move(cfg));
        app.run();
    }
    catch (const ConfigInvalid& ex) {
        std::println(stderr, "invalid configuration: {}", ex.what());
        return 1;
    }
    catch (const std::exception& ex) {
        std::println(stderr, "{}", ex.what());
        return 1;
    }
}
