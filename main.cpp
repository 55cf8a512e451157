#include "config/ConfigRegistry.hpp"
#include "device/Driver.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace ib;
using namespace ib::config;
using namespace ib::device;

namespace {

constexpr const char* DEFAULT_CONFIG = "/etc/inkbridge/config.yaml";

void usage() {
    std::cerr <<
        "usage: inkbridge [-c config.yaml] <command> [args...]\n"
        "\n"
        "commands:\n"
        "  status                       probe the tablet and print device information\n"
        "  ls [--folders]               list documents (or folders) on the tablet\n"
        "  send [--folder NAME] [--format epub|pdf] FILE...\n"
        "                               send books to the tablet\n"
        "  config                       print the effective configuration\n";
}

std::atomic<std::atomic<bool>*> interruptFlag{nullptr};

void signalHandler(const int signum) {
    // Conversions run in their own process groups and will not see the terminal's signal.
    // A second signal terminates immediately.
    if (auto* flag = interruptFlag.load()) flag->store(true);
    std::signal(signum, SIG_DFL);
}

Driver connect(Config cfg) {
    Driver driver(std::move(cfg));
    if (!driver.detect(true))
        throw ConnectivityError(fmt::format("No reMarkable reachable at {}; is it connected over USB with the "
                                            "web interface enabled?", driver.config().device.address));
    return driver;
}

int cmdStatus(const Config& cfg) {
    Driver driver(cfg);
    if (!driver.detect(true)) {
        fmt::print("not connected ({})\n", cfg.device.address);
        return 1;
    }
    const auto info = driver.deviceInformation();
    fmt::print("{} ({}) at {}\nsession: {}\n", info.name, info.model, info.address, info.session_id);
    return 0;
}

int cmdList(const Config& cfg, const std::vector<std::string>& args) {
    const bool folders = !args.empty() && args.front() == "--folders";
    auto driver = connect(cfg);

    const auto tree = driver.fileTree();

    for (const auto& path : folders ? tree.allFolderPaths() : tree.allFileNames())
        fmt::print("{}\n", path);
    return 0;
}

int cmdSend(Config cfg, const std::vector<std::string>& args) {
    std::vector<std::filesystem::path> files;
    std::vector<std::string> names;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--folder" && i + 1 < args.size()) cfg.transfer.target_folder = args[++i];
        else if (args[i] == "--format" && i + 1 < args.size()) cfg.transfer.preferred_format = args[++i];
        else {
            files.emplace_back(args[i]);
            names.push_back(files.back().filename().string());
        }
    }
    validate(cfg);

    if (files.empty()) {
        usage();
        return 2;
    }
    for (const auto& f : files)
        if (!std::filesystem::is_regular_file(f)) throw std::runtime_error("No such file: " + f.string());

    auto driver = connect(std::move(cfg));
    const auto flag = driver.interruptFlag();
    interruptFlag.store(flag.get());

    const auto sub = driver.progress()->subscribe([](const double fraction, const std::string& status) {
        fmt::print(stderr, "\r[{:3.0f}%] {:<60.60}", fraction * 100.0, status);
    });

    std::vector<std::string> locations;
    try {
        locations = driver.uploadBooks(files, names);
    } catch (const std::exception&) {
        interruptFlag.store(nullptr);
        fmt::print(stderr, "\n");
        throw;
    }
    interruptFlag.store(nullptr);
    driver.progress()->unsubscribe(sub);
    fmt::print(stderr, "\n");

    for (const auto& loc : locations) fmt::print("sent {}\n", loc);
    return 0;
}

}

int main(const int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::filesystem::path configPath = DEFAULT_CONFIG;
    if (args.size() >= 2 && (args[0] == "-c" || args[0] == "--config")) {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        usage();
        return args.empty() ? 2 : 0;
    }

    try {
        if (std::filesystem::exists(configPath)) ConfigRegistry::init(configPath);
        else ConfigRegistry::init(Config{});
        log::Registry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "[!] Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const auto cmd = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    const auto& cfg = ConfigRegistry::get();

    try {
        if (cmd == "status") return cmdStatus(cfg);
        if (cmd == "ls") return cmdList(cfg, rest);
        if (cmd == "send") return cmdSend(cfg, rest);
        if (cmd == "config") {
            std::cout << dumpConfig(cfg) << std::endl;
            return 0;
        }
        usage();
        return 2;
    } catch (const std::exception& e) {
        log::Registry::inkbridge()->error("[main] {} failed: {}", cmd, e.what());
        return 1;
    }
}
