#pragma once

#include "transfer/Item.hpp"
#include "transfer/ProgressChannel.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ib::device { class Crawler; }
namespace ib::upload { class Transport; }
namespace ib::convert { class Converter; }

namespace ib::transfer {

struct TransferSettings {
    std::string target_folder{};
    std::string preferred_format{"pdf"};
    bool inject_cover{true};
};

/**
 * Sends a batch of books to the tablet in two phases.
 *
 * Conversion runs on a small worker pool and is all-or-nothing: the first
 * failure cancels the rest and nothing is uploaded. Uploads then run one at
 * a time in batch order, after a single navigation to the target folder.
 * Setting the interrupt flag from another thread (or a signal handler)
 * kills running conversions and stops before the next upload.
 */
class Orchestrator {
public:
    static constexpr double CONVERSION_SHARE = 0.39;
    static constexpr double UPLOAD_BASE_AFTER_CONVERSION = 0.40;
    static constexpr double INITIAL_PROGRESS = 0.01;

    Orchestrator(const device::Crawler& crawler, const upload::Transport& transport,
                 std::shared_ptr<convert::Converter> converter, TransferSettings settings,
                 std::shared_ptr<ProgressChannel> progress,
                 std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // Returns the visible names of the uploaded books, in batch order.
    std::vector<std::string> run(const std::vector<std::filesystem::path>& files,
                                 const std::vector<std::string>& names);

    static unsigned int workerCount(size_t items, unsigned int cpus = std::thread::hardware_concurrency());

private:
    const device::Crawler& crawler_;
    const upload::Transport& transport_;
    std::shared_ptr<convert::Converter> converter_;
    TransferSettings settings_;
    std::shared_ptr<ProgressChannel> progress_;
    std::shared_ptr<std::atomic<bool>> interrupt_;   // set to cancel; also set internally on first failure

    std::string resolveFolder() const;
    void convertAll(std::vector<Item>& items);
    std::vector<std::string> uploadAll(std::vector<Item>& items, const std::string& folderId, double base);
};

}
