#pragma once

#include "config/Config.hpp"
#include "device/Crawler.hpp"
#include "device/Session.hpp"
#include "library/Reconciler.hpp"
#include "transfer/ProgressChannel.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ib::http { class Client; }
namespace ib::convert { class Converter; }

namespace ib::device {

enum class Capability { Supported, Unsupported };

struct CapabilityResult {
    Capability status{Capability::Supported};
    std::string message{};

    [[nodiscard]] bool ok() const { return status == Capability::Supported; }
};

struct DeviceInformation {
    std::string name, model, address, session_id;
};

/**
 * Host-facing entry point: detection, listing, sending and booklist
 * bookkeeping for one tablet.
 *
 * Not thread-safe. The tablet keeps a single "current directory" for all
 * clients, so a host must not poll detect() while a transfer is running.
 */
class Driver {
public:
    explicit Driver(config::Config cfg,
                    std::shared_ptr<http::Client> client = nullptr,
                    std::shared_ptr<convert::Converter> converter = nullptr);

    // Throttled reachability poll; never throws.
    bool detect(bool force = false);
    void eject();

    [[nodiscard]] const std::optional<Session>& session() const { return session_; }
    [[nodiscard]] DeviceInformation deviceInformation() const;

    // Full document tree of the connected tablet.
    FileTree fileTree(const ScanProgressFn& onProgress = {}) const;

    library::Booklist books();
    library::MergeResult syncBooklists(library::Booklist local);

    // Returns the host locations of the uploaded books.
    std::vector<std::string> uploadBooks(const std::vector<std::filesystem::path>& files,
                                         const std::vector<std::string>& names);

    // The tablet exposes no delete endpoint; always Unsupported, never touches a booklist.
    [[nodiscard]] CapabilityResult deleteBooks(const std::vector<std::string>& paths) const;

    static void addBooksToMetadata(const std::vector<std::string>& locations,
                                   const std::vector<library::BookMetadata>& metadata,
                                   library::Booklist& booklist);
    static void removeBooksFromMetadata(const std::vector<std::string>& paths, library::Booklist& booklist);

    // Async-signal-safe; cancels a running uploadBooks() batch.
    void interrupt() const { interrupt_->store(true); }
    [[nodiscard]] std::shared_ptr<std::atomic<bool>> interruptFlag() const { return interrupt_; }

    [[nodiscard]] std::shared_ptr<transfer::ProgressChannel> progress() const { return progress_; }
    [[nodiscard]] const config::Config& config() const { return cfg_; }

private:
    config::Config cfg_;
    std::shared_ptr<http::Client> client_;
    std::shared_ptr<convert::Converter> converter_;
    std::shared_ptr<transfer::ProgressChannel> progress_;
    std::shared_ptr<std::atomic<bool>> interrupt_;

    std::optional<Session> session_;
    std::optional<std::chrono::steady_clock::time_point> lastProbe_;

    const Session& requireSession() const;
};

}
