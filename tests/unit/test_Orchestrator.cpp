#include <gtest/gtest.h>
#include "transfer/Orchestrator.hpp"
#include "device/Crawler.hpp"
#include "upload/Transport.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "support/EpubFixture.hpp"
#include "support/FakeClient.hpp"
#include "support/FakeConverter.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;
using namespace ib;
using namespace ib::transfer;
using namespace ib::test;

namespace {

constexpr const char* ADDRESS = "10.11.99.1";

std::vector<std::string> uploadedFilenames(const FakeClient& client) {
    std::vector<std::string> names;
    for (const auto& c : client.calls()) {
        if (c.method != "POST") continue;
        const auto start = c.body.find("filename=\"") + 10;
        names.push_back(c.body.substr(start, c.body.find('"', start) - start));
    }
    return names;
}

}

class OrchestratorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeClient> client = std::make_shared<FakeClient>();
    std::shared_ptr<FakeConverter> converter = std::make_shared<FakeConverter>();
    std::shared_ptr<ProgressChannel> progress = std::make_shared<ProgressChannel>();
    std::shared_ptr<std::atomic<bool>> interrupt = std::make_shared<std::atomic<bool>>(false);
    device::Crawler crawler{client, ADDRESS};
    upload::Transport transport{client, ADDRESS};
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("inkbridge_orch_" + util::generate_random_suffix());
        fs::create_directories(dir);
        client->listings[""] = nlohmann::json::array({folder("f-books", "Books"), document("d1", "Old")});
        client->listings["f-books"] = nlohmann::json::array();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    Orchestrator make(TransferSettings settings = {}) {
        return {crawler, transport, converter, std::move(settings), progress, interrupt};
    }

    std::vector<fs::path> epubs(const std::vector<std::string>& names) {
        std::vector<fs::path> out;
        for (const auto& n : names) out.push_back(writeEpub(dir / n));
        return out;
    }

    std::vector<fs::path> pdfs(const std::vector<std::string>& names) {
        std::vector<fs::path> out;
        for (const auto& n : names) {
            util::writeFile(dir / n, "%PDF-1.4 " + n);
            out.push_back(dir / n);
        }
        return out;
    }
};

TEST_F(OrchestratorTest, EmptyBatchDoesNothing) {
    auto orch = make();
    EXPECT_TRUE(orch.run({}, {}).empty());
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(OrchestratorTest, NavigatesOnceForWholeBatch) {
    auto orch = make({.target_folder = "Books", .preferred_format = "epub"});
    const auto files = pdfs({"a.pdf", "b.pdf", "c.pdf"});

    const auto uploaded = orch.run(files, {"a.pdf", "b.pdf", "c.pdf"});
    EXPECT_EQ(uploaded, (std::vector<std::string>{"a.pdf", "b.pdf", "c.pdf"}));

    // folder lookup crawls root and Books, then one navigation, then the uploads
    const auto calls = client->calls();
    ASSERT_EQ(calls.size(), 6u);
    EXPECT_EQ(calls[0].url, "http://10.11.99.1/documents/");
    EXPECT_EQ(calls[1].url, "http://10.11.99.1/documents/f-books");
    EXPECT_EQ(calls[2].method, "GET");
    EXPECT_EQ(calls[2].url, "http://10.11.99.1/documents/f-books");
    for (size_t i = 3; i < 6; ++i) EXPECT_EQ(calls[i].method, "POST");
}

TEST_F(OrchestratorTest, UnknownFolderFallsBackToRoot) {
    auto orch = make({.target_folder = "Missing", .preferred_format = "epub"});
    (void)orch.run(pdfs({"a.pdf"}), {"a.pdf"});

    // lookup crawls root and Books, then navigates back to the root before uploading
    const auto calls = client->calls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[1].url, "http://10.11.99.1/documents/f-books");
    EXPECT_EQ(calls[2].method, "GET");
    EXPECT_EQ(calls[2].url, "http://10.11.99.1/documents/");
    EXPECT_EQ(calls[3].method, "POST");
}

TEST_F(OrchestratorTest, NoFolderRequestedNavigatesToRoot) {
    auto orch = make({.preferred_format = "epub"});
    (void)orch.run(pdfs({"a.pdf", "b.pdf"}), {"a.pdf", "b.pdf"});

    const auto calls = client->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].method, "GET");
    EXPECT_EQ(calls[0].url, "http://10.11.99.1/documents/");
    EXPECT_EQ(calls[1].method, "POST");
    EXPECT_EQ(calls[2].method, "POST");
}

TEST_F(OrchestratorTest, FolderLookupFailureStillUploads) {
    client->onGet = [](const http::Request&) { return FakeClient::transportError(CURLE_COULDNT_CONNECT); };
    auto orch = make({.target_folder = "Books", .preferred_format = "epub"});
    EXPECT_EQ(orch.run(pdfs({"a.pdf"}), {"a.pdf"}).size(), 1u);
    EXPECT_EQ(client->count("POST"), 1u);
}

TEST_F(OrchestratorTest, ConvertsEpubsAndRenamesUploads) {
    auto orch = make();
    const auto files = epubs({"dune.epub", "emma.epub"});

    const auto uploaded = orch.run(files, {"Books/Dune.epub", "Emma.epub"});
    EXPECT_EQ(uploaded, (std::vector<std::string>{"Books/Dune.epub", "Emma.epub"}));
    EXPECT_EQ(uploadedFilenames(*client), (std::vector<std::string>{"Dune.pdf", "Emma.pdf"}));
    EXPECT_EQ(converter->sources().size(), 2u);

    for (const auto& p : converter->produced()) EXPECT_FALSE(fs::exists(p)) << p;
    for (const auto& c : client->calls())
        if (c.method == "POST") EXPECT_NE(c.body.find("Content-Type: application/pdf"), std::string::npos);
}

TEST_F(OrchestratorTest, MixedBatchConvertsOnlyEpubs) {
    auto orch = make();
    auto files = epubs({"dune.epub"});
    const auto paper = pdfs({"paper.pdf"});
    files.insert(files.end(), paper.begin(), paper.end());

    (void)orch.run(files, {"Dune.epub", "Paper.pdf"});
    ASSERT_EQ(converter->sources().size(), 1u);
    EXPECT_EQ(converter->sources()[0].filename(), "dune.epub");
    EXPECT_EQ(uploadedFilenames(*client), (std::vector<std::string>{"Dune.pdf", "Paper.pdf"}));
}

TEST_F(OrchestratorTest, EpubPreferenceSkipsConversion) {
    auto orch = make({.preferred_format = "epub"});
    (void)orch.run(epubs({"dune.epub"}), {"Dune.epub"});
    EXPECT_TRUE(converter->sources().empty());
    EXPECT_EQ(uploadedFilenames(*client), (std::vector<std::string>{"Dune.epub"}));
}

TEST_F(OrchestratorTest, ConversionFailureUploadsNothing) {
    converter->failing = {"b.epub"};
    converter->delay = std::chrono::milliseconds(20);
    auto orch = make({.target_folder = "Books"});

    try {
        (void)orch.run(epubs({"a.epub", "b.epub", "c.epub"}), {"Alpha.epub", "Beta.epub", "Gamma.epub"});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("'Beta.epub'"), std::string::npos) << msg;
        EXPECT_NE(msg.find("item 2 of 3"), std::string::npos) << msg;
        EXPECT_NE(msg.find("bad markup"), std::string::npos) << msg;
    }

    EXPECT_EQ(client->count("POST"), 0u);
    for (const auto& p : converter->produced()) EXPECT_FALSE(fs::exists(p)) << p;
}

TEST_F(OrchestratorTest, MissingConverterIsAnError) {
    Orchestrator orch{crawler, transport, nullptr, {}, progress, interrupt};
    EXPECT_THROW((void)orch.run(epubs({"a.epub"}), {"a.epub"}), TransferError);
    EXPECT_EQ(client->count("POST"), 0u);
}

TEST_F(OrchestratorTest, InterruptDuringConversion) {
    converter->delay = std::chrono::milliseconds(2000);
    converter->raiseOnCall = interrupt.get();
    auto orch = make();

    try {
        (void)orch.run(epubs({"a.epub", "b.epub"}), {"a.epub", "b.epub"});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_NE(std::string(e.what()).find("interrupted during conversion"), std::string::npos);
    }
    EXPECT_EQ(client->count("POST"), 0u);
}

TEST_F(OrchestratorTest, InterruptBetweenUploads) {
    client->onPost = [this](const http::Request&, const std::string&) {
        interrupt->store(true);
        return FakeClient::respond(200);
    };
    auto orch = make({.preferred_format = "epub"});

    try {
        (void)orch.run(pdfs({"a.pdf", "b.pdf", "c.pdf"}), {"a.pdf", "b.pdf", "c.pdf"});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_NE(std::string(e.what()).find("after 1 of 3"), std::string::npos);
    }
    EXPECT_EQ(client->count("POST"), 1u);
}

TEST_F(OrchestratorTest, RunClearsStaleInterrupt) {
    interrupt->store(true);
    auto orch = make({.preferred_format = "epub"});
    EXPECT_EQ(orch.run(pdfs({"a.pdf"}), {"a.pdf"}).size(), 1u);
}

TEST_F(OrchestratorTest, UploadFailureStopsBatchWithOriginalError) {
    size_t posts = 0;
    client->onPost = [&](const http::Request&, const std::string&) {
        return ++posts == 2 ? FakeClient::respond(507, "full") : FakeClient::respond(200);
    };
    auto orch = make();

    EXPECT_THROW((void)orch.run(epubs({"a.epub", "b.epub", "c.epub"}), {"a.epub", "b.epub", "c.epub"}),
                 ProtocolError);
    EXPECT_EQ(client->count("POST"), 2u);
    for (const auto& p : converter->produced()) EXPECT_FALSE(fs::exists(p)) << p;
}

TEST_F(OrchestratorTest, ProgressIsMonotonicAndCompletes) {
    std::mutex m;
    std::vector<double> seen;
    std::vector<std::string> statuses;
    progress->subscribe([&](const double f, const std::string& s) {
        std::scoped_lock lock(m);
        seen.push_back(f);
        statuses.push_back(s);
    });

    auto orch = make();
    (void)orch.run(epubs({"a.epub", "b.epub"}), {"A.epub", "B.epub"});

    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_DOUBLE_EQ(seen.back(), 1.0);
    EXPECT_NE(std::find(statuses.begin(), statuses.end(), "Uploading: A.pdf"), statuses.end());
    EXPECT_NE(std::find(statuses.begin(), statuses.end(), "Uploading: B.pdf"), statuses.end());
}

TEST_F(OrchestratorTest, ConversionProgressStaysBelowUploadWindow) {
    std::vector<double> converting;
    std::mutex m;
    progress->subscribe([&](const double f, const std::string& s) {
        std::scoped_lock lock(m);
        if (s.starts_with("Convert")) converting.push_back(f);
    });

    auto orch = make();
    (void)orch.run(epubs({"a.epub"}), {"a.epub"});

    ASSERT_FALSE(converting.empty());
    for (const auto f : converting) {
        EXPECT_GE(f, Orchestrator::INITIAL_PROGRESS);
        EXPECT_LE(f, Orchestrator::UPLOAD_BASE_AFTER_CONVERSION);
    }
}

TEST(OrchestratorWorkersTest, WorkerCountBounds) {
    EXPECT_EQ(Orchestrator::workerCount(10, 1), 2u);
    EXPECT_EQ(Orchestrator::workerCount(10, 16), 4u);
    EXPECT_EQ(Orchestrator::workerCount(3, 16), 3u);
    EXPECT_EQ(Orchestrator::workerCount(1, 8), 1u);
    EXPECT_EQ(Orchestrator::workerCount(0, 8), 1u);
}

TEST(ItemTest, BuildItems) {
    const auto items = buildItems({"/tmp/x/dune.epub", "/tmp/x/paper.PDF", "/tmp/x/emma.EPUB"},
                                  {"Books/Dune.epub", "Paper.pdf", ""}, "pdf");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].upload_name, "Dune.epub");
    EXPECT_TRUE(items[0].needs_conversion);
    EXPECT_FALSE(items[1].needs_conversion);
    EXPECT_EQ(items[2].upload_name, "emma.EPUB");
    EXPECT_TRUE(items[2].needs_conversion);
    EXPECT_EQ(items[2].index, 2u);
    EXPECT_EQ(items[0].uploadPath(), fs::path("/tmp/x/dune.epub"));
}

TEST(ItemTest, MismatchedNamesAreRejected) {
    EXPECT_THROW((void)buildItems({"a.epub", "b.epub"}, {"a.epub"}, "pdf"), std::invalid_argument);
}

TEST(ItemTest, AdoptConvertedSwitchesPathAndExtension) {
    auto items = buildItems({"dune.epub"}, {"Dune.epub"}, "pdf");
    const auto pdf = util::makeTempPath("test", ".pdf");
    util::writeFile(pdf, "%PDF");

    items[0].adoptConverted(util::TempFile(pdf));
    EXPECT_EQ(items[0].upload_name, "Dune.pdf");
    EXPECT_EQ(items[0].uploadPath(), pdf);

    items[0].converted.release();
    EXPECT_FALSE(fs::exists(pdf));
    EXPECT_EQ(items[0].uploadPath(), fs::path("dune.epub"));
}
