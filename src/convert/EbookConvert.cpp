#include "convert/EbookConvert.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <regex>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace ib::convert;
using namespace ib::log;

namespace {

constexpr size_t MAX_CAPTURE = 64 * 1024;
const std::regex PERCENT_RE(R"((\d+)%)");

struct ProcessResult {
    int exit_code{-1};
    bool timed_out{false};
    bool cancelled{false};
    std::string output;
};

void killGroup(const pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

void reportLine(const std::string& line, const ConvertProgressFn& onProgress) {
    if (!onProgress) return;
    std::smatch m;
    if (!std::regex_search(line, m, PERCENT_RE)) return;
    const auto digits = m[1].str();
    const auto pct = digits.size() > 3 ? 100UL : std::min(std::stoul(digits), 100UL);
    onProgress(static_cast<double>(pct) / 100.0);
}

// Runs argv with stdout and stderr merged into one pipe, feeding complete lines to onProgress.
ProcessResult runProcess(const std::vector<std::string>& args, const std::chrono::seconds timeout,
                         const std::atomic<bool>& cancel, const ConvertProgressFn& onProgress) {
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1)
        throw ib::ConversionError(fmt::format("Failed to create pipe: {}", std::strerror(errno)));

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw ib::ConversionError(fmt::format("Failed to fork converter: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        setpgid(0, 0);  // own process group so a kill reaches Calibre's workers too
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);
    const int fd = pipefd[0];

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string pending;
    char buf[4096];

    const auto mustStop = [&] {
        if (cancel.load()) result.cancelled = true;
        else if (std::chrono::steady_clock::now() >= deadline) result.timed_out = true;
        return result.cancelled || result.timed_out;
    };

    bool eof = false;
    while (!eof) {
        if (mustStop()) break;

        pollfd pfd{fd, POLLIN, 0};
        const int rc = poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) {
            eof = true;
            break;
        }

        result.output.append(buf, static_cast<size_t>(n));
        if (result.output.size() > MAX_CAPTURE) result.output.erase(0, result.output.size() - MAX_CAPTURE);

        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find_first_of("\r\n")) != std::string::npos) {
            reportLine(pending.substr(0, pos), onProgress);
            pending.erase(0, pos + 1);
        }
    }
    if (!pending.empty() && !result.cancelled && !result.timed_out) reportLine(pending, onProgress);
    close(fd);

    int status = 0;
    while (true) {
        if (result.cancelled || result.timed_out) {
            killGroup(pid);
            waitpid(pid, &status, 0);
            return result;
        }

        const pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR)
            throw ib::ConversionError(fmt::format("waitpid failed: {}", std::strerror(errno)));

        mustStop();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);
    return result;
}

std::string tail(const std::string& s, const size_t n) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

bool isExecutable(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

}

ConversionOptions ConversionOptions::fromConfig(const config::Config& cfg) {
    ConversionOptions opts;
    opts.model = device::parseModel(cfg.device.model);
    opts.margin = cfg.conversion.pdf_margin;
    opts.font_size = cfg.conversion.pdf_font_size;
    opts.font = cfg.conversion.pdf_font;
    opts.embed_all_fonts = cfg.conversion.embed_all_fonts;
    opts.timeout = cfg.conversion.timeout;
    return opts;
}

EbookConvert::EbookConvert(ConversionOptions opts, std::filesystem::path executable)
    : opts_(std::move(opts)), executable_(std::move(executable)) {}

std::filesystem::path EbookConvert::locateExecutable(const std::filesystem::path& configured) {
    if (!configured.empty()) {
        if (isExecutable(configured)) return configured;
        throw ib::ConversionError(fmt::format("Configured converter {} is not an executable file", configured.string()));
    }

    if (const char* path = std::getenv("PATH")) {
        std::string_view rest(path);
        while (!rest.empty()) {
            const auto colon = rest.find(':');
            const auto dir = rest.substr(0, colon);
            if (!dir.empty()) {
                const auto candidate = std::filesystem::path(dir) / "ebook-convert";
                if (isExecutable(candidate)) return candidate;
            }
            if (colon == std::string_view::npos) break;
            rest.remove_prefix(colon + 1);
        }
    }

    for (const auto* dir : {"/opt/calibre", "/usr/lib/calibre", "/Applications/calibre.app/Contents/MacOS"}) {
        const auto candidate = std::filesystem::path(dir) / "ebook-convert";
        if (isExecutable(candidate)) return candidate;
    }

    throw ib::ConversionError("ebook-convert not found; install Calibre or set conversion.executable");
}

std::vector<std::string> EbookConvert::buildArgs(const std::filesystem::path& source,
                                                 const std::filesystem::path& output) const {
    const auto& preset = device::presetFor(opts_.model);
    const auto margin = std::to_string(opts_.margin ? opts_.margin : preset.margin);
    const auto fontSize = std::to_string(opts_.font_size ? opts_.font_size : preset.font_size);

    std::vector<std::string> args{
        executable_.empty() ? std::string("ebook-convert") : executable_.string(),
        source.string(), output.string(),
        "--output-profile", "generic_eink_hd",
        "--custom-size", fmt::format("{}x{}", preset.width_in, preset.height_in),
        "--pdf-page-margin-top", margin,
        "--pdf-page-margin-bottom", margin,
        "--pdf-page-margin-left", margin,
        "--pdf-page-margin-right", margin,
        "--pdf-default-font-size", fontSize,
    };
    if (opts_.embed_all_fonts) args.emplace_back("--embed-all-fonts");
    if (!opts_.font.empty()) {
        args.emplace_back("--pdf-serif-family");
        args.push_back(opts_.font);
    }
    return args;
}

ib::util::TempFile EbookConvert::toPdf(const std::filesystem::path& source,
                                       const ConvertProgressFn& onProgress,
                                       const std::atomic<bool>& cancel) {
    std::call_once(resolved_, [this] { executable_ = locateExecutable(executable_); });

    util::TempFile out(util::makeTempPath("convert", ".pdf"));
    const auto args = buildArgs(source, out.path());

    Registry::convert()->info("[EbookConvert] Converting {} -> {}", source.string(), out.path().string());
    Registry::convert()->debug("[EbookConvert] {}", fmt::join(args, " "));

    const auto res = runProcess(args, opts_.timeout, cancel, onProgress);

    if (res.cancelled) {
        Registry::convert()->info("[EbookConvert] Conversion of {} cancelled", source.string());
        throw ib::ConversionError(fmt::format("Conversion of {} cancelled", source.filename().string()));
    }

    if (res.timed_out) {
        Registry::convert()->error("[EbookConvert] {} timed out after {}s", source.string(), opts_.timeout.count());
        throw ib::TimeoutError(fmt::format("ebook-convert timed out after {}s converting {}",
                                           opts_.timeout.count(), source.filename().string()));
    }

    if (res.exit_code != 0) {
        const auto diag = tail(res.output, DIAGNOSTIC_TAIL);
        Registry::convert()->error("[EbookConvert] {} failed (exit code {}): {}", source.string(), res.exit_code, diag);
        throw ib::ConversionError(fmt::format("ebook-convert failed for {} (exit code {}): {}",
                                              source.filename().string(), res.exit_code, diag));
    }

    std::error_code ec;
    if (!std::filesystem::exists(out.path(), ec) || std::filesystem::file_size(out.path(), ec) == 0)
        throw ib::ConversionError(fmt::format("ebook-convert produced no output for {}", source.filename().string()));

    if (onProgress) onProgress(1.0);
    return out;
}
