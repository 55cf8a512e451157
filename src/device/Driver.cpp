#include "device/Driver.hpp"
#include "convert/EbookConvert.hpp"
#include "http/Client.hpp"
#include "transfer/Orchestrator.hpp"
#include "upload/Transport.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

using namespace ib::device;
using namespace ib::library;
using namespace ib::log;

Driver::Driver(config::Config cfg, std::shared_ptr<http::Client> client,
               std::shared_ptr<convert::Converter> converter)
    : cfg_(std::move(cfg)), client_(std::move(client)), converter_(std::move(converter)),
      progress_(std::make_shared<transfer::ProgressChannel>()),
      interrupt_(std::make_shared<std::atomic<bool>>(false)) {
    if (!client_) client_ = std::make_shared<http::CurlClient>();
    if (!converter_)
        converter_ = std::make_shared<convert::EbookConvert>(convert::ConversionOptions::fromConfig(cfg_),
                                                             cfg_.conversion.executable);
}

bool Driver::detect(const bool force) {
    const auto now = std::chrono::steady_clock::now();
    if (!force && lastProbe_ && now - *lastProbe_ < cfg_.device.detection_interval)
        return session_.has_value();
    lastProbe_ = now;

    const auto& address = cfg_.device.address;
    if (!Crawler::isReachable(*client_, address, cfg_.device.probe_timeout)) {
        if (session_) Registry::device()->info("[Driver] Lost {}", session_->str());
        session_.reset();
        return false;
    }

    if (!session_) {
        session_.emplace(address);
        Registry::device()->info("[Driver] Detected {}", session_->str());
    }
    return true;
}

void Driver::eject() {
    if (session_) Registry::device()->info("[Driver] Ejecting {}", session_->str());
    session_.reset();
    lastProbe_.reset();
}

const Session& Driver::requireSession() const {
    if (!session_) throw ConnectivityError(fmt::format("No tablet connected at {}", cfg_.device.address));
    return *session_;
}

DeviceInformation Driver::deviceInformation() const {
    const auto& s = requireSession();
    return {"reMarkable", std::string(presetFor(parseModel(cfg_.device.model)).name), s.address, s.id};
}

FileTree Driver::fileTree(const ScanProgressFn& onProgress) const {
    const auto& s = requireSession();
    const Crawler crawler(client_, s.address, cfg_.device.listing_timeout, cfg_.device.max_crawl_depth);
    return crawler.buildTree("", onProgress);
}

Booklist Driver::books() {
    return syncBooklists({}).local;
}

MergeResult Driver::syncBooklists(Booklist local) {
    const auto& s = requireSession();
    progress_->reset();
    progress_->publish(0.01, "Connecting to reMarkable...");

    Booklist remote;
    try {
        const auto tree = fileTree([this](const size_t seen) {
            progress_->publish(scanFraction(seen), fmt::format("Scanning reMarkable... {} items found", seen));
        });
        progress_->publish(0.8, "Building book list...");
        remote = Reconciler::booksFromTree(tree);
        Registry::device()->info("[Driver] Book list: {} entries on {}", remote.size(), s.str());
    } catch (const std::exception& e) {
        Registry::device()->warn("[Driver] Failed to fetch book list from {}: {}", s.str(), e.what());
    }

    progress_->publish(0.9, "Syncing book list...");
    auto merged = Reconciler::merge(std::move(local), std::move(remote));
    progress_->publish(1.0, "");
    return merged;
}

std::vector<std::string> Driver::uploadBooks(const std::vector<std::filesystem::path>& files,
                                             const std::vector<std::string>& names) {
    const auto& s = requireSession();

    const Crawler crawler(client_, s.address, cfg_.device.listing_timeout, cfg_.device.max_crawl_depth);
    const upload::Transport transport(client_, s.address, cfg_.device.listing_timeout, cfg_.device.upload_timeout);

    transfer::Orchestrator orchestrator(crawler, transport, converter_, {
        .target_folder = cfg_.transfer.target_folder,
        .preferred_format = cfg_.transfer.preferred_format,
        .inject_cover = cfg_.transfer.inject_cover
    }, progress_, interrupt_);

    return orchestrator.run(files, names);
}

CapabilityResult Driver::deleteBooks(const std::vector<std::string>& paths) const {
    std::string listing;
    for (const auto& p : paths)
        listing += fmt::format("\n  - {}", std::filesystem::path(p).filename().string());

    Registry::device()->warn("[Driver] Refusing to delete {} books: the USB web interface has no delete endpoint",
                             paths.size());
    return {Capability::Unsupported,
            "The reMarkable USB web interface does not support deleting books.\n\n"
            "Please delete these directly on your reMarkable:" + listing};
}

void Driver::addBooksToMetadata(const std::vector<std::string>& locations,
                                const std::vector<BookMetadata>& metadata, Booklist& booklist) {
    Reconciler::addToBooklist(locations, metadata, booklist);
}

void Driver::removeBooksFromMetadata(const std::vector<std::string>& paths, Booklist& booklist) {
    Reconciler::removeFromBooklist(paths, booklist);
}
