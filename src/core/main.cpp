#include "riglink/application.hpp"
#include "riglink/capability/catalog.hpp"
#include "riglink/config/config_manager.hpp"
#include "riglink/version.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string_view>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [config.yaml]\n"
              << "       " << program << " --check-config [config.yaml]\n"
              << "       " << program << " --list-models [config.yaml]\n"
              << "       " << program << " --version" << std::endl;
}

// Loads the configuration and its catalog without touching any serial port.
int check_config(const std::filesystem::path& path, bool listModels) {
    riglink::config::ConfigManager configManager{path};
    const auto& cfg = configManager.current();
    const auto catalog = riglink::capability::CapabilityCatalog::load_file(cfg.catalog.path);

    if (listModels) {
        for (const auto& model : catalog.models()) {
            const auto caps = catalog.lookup(model);
            std::cout << model << " (" << caps->manufacturer << ", "
                      << riglink::capability::to_string(caps->family) << ")\n";
        }
        return 0;
    }

    int unknown = 0;
    for (const auto& radio : cfg.radios) {
        if (!catalog.lookup(radio.model)) {
            std::cerr << "Radio '" << radio.id << "': unknown model " << radio.model << std::endl;
            ++unknown;
        }
    }
    std::cout << cfg.service.id << ": " << cfg.radios.size() << " radio(s), " << catalog.size()
              << " models, rigctld on " << cfg.network.bind_address << ":" << cfg.network.rigctld_port
              << std::endl;
    return unknown == 0 ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path configPath = "config/default.yaml";
    std::string_view mode;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--version") {
            std::cout << "riglinkd " << riglink::version() << " (" << riglink::git_revision() << ", built "
                      << riglink::build_timestamp() << ")" << std::endl;
            return 0;
        }
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--check-config" || arg == "--list-models") {
            mode = arg;
        } else if (!arg.empty() && arg.front() == '-') {
            print_usage(argv[0]);
            return 1;
        } else {
            configPath = argv[i];
        }
    }

    try {
        if (!mode.empty()) {
            return check_config(configPath, mode == "--list-models");
        }

        std::cout << "riglinkd " << riglink::version() << " using " << configPath.string() << std::endl;

        asio::io_context io_context{1};
        riglink::Application app{io_context, configPath};

        asio::signal_set signals{io_context, SIGINT, SIGTERM};
        signals.async_wait([&](const asio::error_code& ec, int signal) {
            if (!ec) {
                std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
                app.stop();
            }
        });

        app.start();
        io_context.run();

        app.stop();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
