#include "transfer/Orchestrator.hpp"
#include "concurrency/ThreadPool.hpp"
#include "convert/Converter.hpp"
#include "device/Crawler.hpp"
#include "upload/Transport.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <fmt/format.h>

using namespace ib::transfer;
using namespace ib::concurrency;
using namespace ib::log;

namespace {

struct Completion {
    size_t slot{0};                              // position in the conversion list
    std::optional<ib::util::TempFile> pdf{};
    std::string error{};
    bool skipped{false};
};

class CompletionQueue {
public:
    void push(Completion c) {
        {
            std::scoped_lock lock(mutex_);
            done_.push_back(std::move(c));
        }
        cv_.notify_one();
    }

    Completion pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !done_.empty(); });
        auto c = std::move(done_.front());
        done_.pop_front();
        return c;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Completion> done_;
};

// Per-item conversion fractions folded into one batch fraction.
class ConversionProgress {
public:
    ConversionProgress(const size_t count, std::shared_ptr<ProgressChannel> channel)
        : fractions_(count, 0.0), channel_(std::move(channel)) {}

    void update(const size_t slot, const double fraction, const std::string& status) {
        double sum = 0.0;
        {
            std::scoped_lock lock(mutex_);
            fractions_[slot] = std::max(fractions_[slot], std::clamp(fraction, 0.0, 1.0));
            for (const auto f : fractions_) sum += f;
        }
        const auto total = Orchestrator::INITIAL_PROGRESS +
                           sum / static_cast<double>(fractions_.size()) * Orchestrator::CONVERSION_SHARE;
        channel_->publish(total, status);
    }

private:
    std::mutex mutex_;
    std::vector<double> fractions_;
    std::shared_ptr<ProgressChannel> channel_;
};

class ConversionTask final : public Task {
public:
    ConversionTask(const size_t slot, std::filesystem::path source, ib::convert::Converter& converter,
                   const std::atomic<bool>& cancel, CompletionQueue& done, ConversionProgress& progress)
        : slot_(slot), source_(std::move(source)), converter_(converter),
          cancel_(cancel), done_(done), progress_(progress) {}

    void operator()() override {
        Completion c{.slot = slot_};
        if (cancel_.load()) {
            c.skipped = true;
            done_.push(std::move(c));
            return;
        }

        try {
            const auto status = fmt::format("Converting {}", source_.filename().string());
            c.pdf = converter_.toPdf(source_, [&](const double f) { progress_.update(slot_, f, status); }, cancel_);
        } catch (const std::exception& e) {
            c.error = e.what();
        }
        done_.push(std::move(c));
    }

private:
    size_t slot_;
    std::filesystem::path source_;
    ib::convert::Converter& converter_;
    const std::atomic<bool>& cancel_;
    CompletionQueue& done_;
    ConversionProgress& progress_;
};

}

Orchestrator::Orchestrator(const device::Crawler& crawler, const upload::Transport& transport,
                           std::shared_ptr<convert::Converter> converter, TransferSettings settings,
                           std::shared_ptr<ProgressChannel> progress,
                           std::shared_ptr<std::atomic<bool>> interruptFlag)
    : crawler_(crawler), transport_(transport), converter_(std::move(converter)),
      settings_(std::move(settings)), progress_(std::move(progress)), interrupt_(std::move(interruptFlag)) {
    if (!progress_) progress_ = std::make_shared<ProgressChannel>();
    if (!interrupt_) interrupt_ = std::make_shared<std::atomic<bool>>(false);
}

unsigned int Orchestrator::workerCount(const size_t items, const unsigned int cpus) {
    const auto byCpu = std::clamp(cpus, 2u, 4u);
    return static_cast<unsigned int>(std::min<size_t>(byCpu, std::max<size_t>(items, 1)));
}

std::string Orchestrator::resolveFolder() const {
    const auto lookup = crawler_.lookupFolder(settings_.target_folder);
    switch (lookup.status) {
        case device::FolderLookup::Status::NotRequested:
            Registry::transfer()->info("[Orchestrator] No target folder configured, uploading to root");
            break;
        case device::FolderLookup::Status::Found:
            Registry::transfer()->info("[Orchestrator] Uploading to folder '{}' (id={})", settings_.target_folder, lookup.id);
            break;
        case device::FolderLookup::Status::NotFound:
            Registry::transfer()->warn("[Orchestrator] Folder '{}' not found on device, uploading to root. "
                                       "Create the folder on the tablet first, then retry.", settings_.target_folder);
            break;
        case device::FolderLookup::Status::LookupFailed:
            Registry::transfer()->warn("[Orchestrator] Could not look up folder '{}', uploading to root",
                                       settings_.target_folder);
            break;
    }
    return lookup.id;
}

std::vector<std::string> Orchestrator::run(const std::vector<std::filesystem::path>& files,
                                           const std::vector<std::string>& names) {
    if (files.empty()) return {};

    auto items = buildItems(files, names, settings_.preferred_format);
    progress_->reset();
    interrupt_->store(false);

    const auto folderId = resolveFolder();

    const bool converting = std::ranges::any_of(items, &Item::needs_conversion);
    if (converting) convertAll(items);

    const auto base = converting ? UPLOAD_BASE_AFTER_CONVERSION : INITIAL_PROGRESS;
    return uploadAll(items, folderId, base);
}

void Orchestrator::convertAll(std::vector<Item>& items) {
    if (!converter_) throw TransferError("Conversion to PDF requested but no converter is available");

    std::vector<Item*> pending;
    for (auto& item : items)
        if (item.needs_conversion) pending.push_back(&item);

    const auto workers = workerCount(pending.size());
    Registry::transfer()->info("[Orchestrator] Converting {} books ({} workers)", pending.size(), workers);
    progress_->publish(INITIAL_PROGRESS, fmt::format("Converting {} books...", pending.size()));

    auto& cancel = *interrupt_;
    CompletionQueue done;
    ConversionProgress convProgress(pending.size(), progress_);
    std::optional<std::pair<const Item*, std::string>> failure;

    {
        ThreadPool pool(workers, "convert");
        for (size_t slot = 0; slot < pending.size(); ++slot)
            pool.submit(std::make_shared<ConversionTask>(slot, pending[slot]->source, *converter_,
                                                         cancel, done, convProgress));

        size_t converted = 0;
        for (size_t received = 0; received < pending.size(); ++received) {
            auto c = done.pop();
            auto* item = pending[c.slot];

            if (c.pdf) {
                item->adoptConverted(std::move(*c.pdf));
                if (cancel.load()) continue;
                ++converted;
                convProgress.update(c.slot, 1.0, fmt::format("Converted {}/{}", converted, pending.size()));
                continue;
            }

            // Once cancelled, remaining errors are just the kills we caused
            if (c.skipped || cancel.load()) continue;

            Registry::transfer()->error("[Orchestrator] Conversion failed for {}: {}", item->visible_name, c.error);
            failure.emplace(item, c.error);
            cancel.store(true);
        }
    } // workers joined

    if (!failure && !cancel.load()) return;

    for (auto& item : items) item.converted.release();

    if (!failure) throw TransferError("Transfer interrupted during conversion, nothing was uploaded");

    const auto& [item, error] = *failure;
    throw TransferError(fmt::format("Conversion failed for '{}' (item {} of {}), nothing was uploaded: {}",
                                    item->visible_name, item->index + 1, items.size(), error));
}

std::vector<std::string> Orchestrator::uploadAll(std::vector<Item>& items, const std::string& folderId,
                                                 const double base) {
    // One navigation serves the whole batch ("" is the root); uploads below skip their own
    transport_.navigate(folderId);

    std::vector<std::string> locations;
    locations.reserve(items.size());
    const auto n = static_cast<double>(items.size());

    for (size_t i = 0; i < items.size(); ++i) {
        auto& item = items[i];
        const double start = base + static_cast<double>(i) / n * (1.0 - base);
        const double end = base + static_cast<double>(i + 1) / n * (1.0 - base);
        const auto status = "Uploading: " + item.upload_name;

        if (interrupt_->load())
            throw TransferError(fmt::format("Transfer interrupted after {} of {} uploads", i, items.size()));

        progress_->publish(start, status);
        try {
            transport_.upload(item.uploadPath(), folderId, item.upload_name, settings_.inject_cover,
                              [&](const double f) { progress_->publish(start + f * (end - start), status); },
                              false);
        } catch (const std::exception& e) {
            item.converted.release();
            Registry::transfer()->error("[Orchestrator] Upload of {} failed, stopping batch: {}", item.visible_name, e.what());
            throw;
        }
        item.converted.release();

        locations.push_back(item.visible_name);
        progress_->publish(end, "");
    }

    Registry::transfer()->info("[Orchestrator] Uploaded {} books", locations.size());
    return locations;
}
