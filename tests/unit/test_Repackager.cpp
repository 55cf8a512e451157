#include <gtest/gtest.h>
#include "epub/CoverInjector.hpp"
#include "epub/Repackager.hpp"
#include "epub/Zip.hpp"
#include "util/files.hpp"
#include "support/EpubFixture.hpp"

#include <algorithm>
#include <filesystem>
#include <pugixml.hpp>

namespace fs = std::filesystem;
using namespace ib::epub;
using namespace ib::test;

namespace {

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

std::vector<std::string> entryNames(const fs::path& path) {
    std::vector<std::string> names;
    ZipReader zip(path);
    for (const auto& e : zip.entries()) names.push_back(e.name);
    return names;
}

}

class RepackagerTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("inkbridge_repack_" + ib::util::generate_random_suffix());
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

TEST_F(RepackagerTest, MimetypeIsFirstStoredAndWithoutExtraFields) {
    const auto src = writeEpub(dir / "book.epub", {.mimetype_first = false});

    const auto prepared = Repackager::prepare(src, false);
    ASSERT_TRUE(prepared.owned_temp);
    EXPECT_NE(prepared.upload_path, src);

    const auto h = firstLocalHeader(prepared.upload_path);
    EXPECT_EQ(h.signature, 0x04034b50u);
    EXPECT_EQ(h.name, "mimetype");
    EXPECT_EQ(h.method, 0);             // stored
    EXPECT_EQ(h.extra_len, 0);
    EXPECT_EQ(h.flags & 0x0008, 0);     // no data descriptor
    EXPECT_EQ(h.payload, "application/epub+zip");

    const auto names = entryNames(prepared.upload_path);
    EXPECT_EQ(std::count(names.begin(), names.end(), "mimetype"), 1);
}

TEST_F(RepackagerTest, CanonicalArchiveKeepsAllContent) {
    const auto src = writeEpub(dir / "book.epub", {.with_directories = true});
    const auto prepared = Repackager::prepare(src, false);

    EXPECT_EQ(entryNames(prepared.upload_path), entryNames(src));

    ZipReader before(src), after(prepared.upload_path);
    for (const auto& e : before.entries()) {
        if (e.is_dir) continue;
        EXPECT_EQ(after.read(e.name), before.read(e.name)) << e.name;
    }
}

TEST_F(RepackagerTest, TempFileIsRemovedWithPrepared) {
    const auto src = writeEpub(dir / "book.epub");
    fs::path out;
    {
        const auto prepared = Repackager::prepare(src, true);
        out = prepared.upload_path;
        EXPECT_TRUE(fs::exists(out));
    }
    EXPECT_FALSE(fs::exists(out));
    EXPECT_TRUE(fs::exists(src));
}

TEST_F(RepackagerTest, NonEpubPassesThrough) {
    const auto pdf = dir / "paper.pdf";
    ib::util::writeFile(pdf, "%PDF-1.4");

    const auto prepared = Repackager::prepare(pdf, true);
    EXPECT_EQ(prepared.upload_path, pdf);
    EXPECT_FALSE(prepared.owned_temp);
}

TEST_F(RepackagerTest, ExtensionMatchIsCaseInsensitive) {
    const auto src = writeEpub(dir / "LOUD.EPUB");
    const auto prepared = Repackager::prepare(src, false);
    EXPECT_TRUE(prepared.owned_temp);
}

TEST_F(RepackagerTest, CorruptArchivePassesThrough) {
    const auto bad = dir / "broken.epub";
    ib::util::writeFile(bad, "this is not a zip archive");

    const auto prepared = Repackager::prepare(bad, true);
    EXPECT_EQ(prepared.upload_path, bad);
    EXPECT_FALSE(prepared.owned_temp);
}

TEST_F(RepackagerTest, InjectsCoverPageFirstInSpine) {
    const auto src = writeEpub(dir / "book.epub");
    const auto prepared = Repackager::prepare(src, true);

    ZipReader zip(prepared.upload_path);
    ASSERT_TRUE(zip.has("OEBPS/rm_cover.xhtml"));
    EXPECT_NE(zip.read("OEBPS/rm_cover.xhtml").find(R"(src="images/cover.jpg")"), std::string::npos);

    pugi::xml_document opf;
    ASSERT_TRUE(opf.load_string(zip.read("OEBPS/content.opf").c_str()));
    const auto pkg = opf.child("package");
    EXPECT_STREQ(pkg.child("spine").first_child().attribute("idref").value(), "rm-cover-page");
    EXPECT_FALSE(pkg.child("manifest").find_child_by_attribute("item", "id", "rm-cover-page").empty());

    const auto ref = pkg.child("guide").find_child_by_attribute("reference", "type", "cover");
    EXPECT_STREQ(ref.attribute("href").value(), "rm_cover.xhtml");
    EXPECT_STREQ(ref.attribute("title").value(), "Cover");

    // namespaces survive the rewrite
    EXPECT_STREQ(pkg.attribute("xmlns").value(), "http://www.idpf.org/2007/opf");
    EXPECT_STREQ(pkg.attribute("xmlns:dc").value(), "http://purl.org/dc/elements/1.1/");
}

TEST_F(RepackagerTest, CoverInjectionIsIdempotent) {
    const auto src = writeEpub(dir / "book.epub");
    const auto once = Repackager::prepare(src, true);

    const auto copy = dir / "once.epub";
    fs::copy_file(once.upload_path, copy);
    const auto twice = Repackager::prepare(copy, true);

    ZipReader a(once.upload_path), b(twice.upload_path);
    EXPECT_EQ(entryNames(once.upload_path), entryNames(twice.upload_path));
    EXPECT_EQ(a.read("OEBPS/content.opf"), b.read("OEBPS/content.opf"));

    const auto opf = b.read("OEBPS/content.opf");
    EXPECT_EQ(countOccurrences(opf, R"(id="rm-cover-page")"), 1u);
    EXPECT_EQ(countOccurrences(opf, R"(idref="rm-cover-page")"), 1u);
    EXPECT_EQ(countOccurrences(opf, R"(type="cover")"), 1u);
}

TEST_F(RepackagerTest, NoInjectionWhenFirstPageShowsCover) {
    const auto src = writeEpub(dir / "book.epub", {.cover_on_first_page = true});
    const auto prepared = Repackager::prepare(src, true);

    ZipReader zip(prepared.upload_path);
    EXPECT_FALSE(zip.has("OEBPS/rm_cover.xhtml"));
    EXPECT_EQ(zip.read("OEBPS/content.opf"), ZipReader(src).read("OEBPS/content.opf"));
}

TEST_F(RepackagerTest, NoInjectionWithoutCoverImage) {
    const auto src = writeEpub(dir / "book.epub", {.with_cover_image = false});
    const auto prepared = Repackager::prepare(src, true);
    EXPECT_FALSE(ZipReader(prepared.upload_path).has("OEBPS/rm_cover.xhtml"));
}

TEST_F(RepackagerTest, InjectionDisabledLeavesPackageUntouched) {
    const auto src = writeEpub(dir / "book.epub");
    const auto prepared = Repackager::prepare(src, false);
    EXPECT_FALSE(ZipReader(prepared.upload_path).has("OEBPS/rm_cover.xhtml"));
}

TEST_F(RepackagerTest, FallsBackToFirstOpfWithoutContainer) {
    const auto src = writeEpub(dir / "book.epub", {.with_container = false});
    ZipReader zip(src);
    EXPECT_EQ(Repackager::locatePackageDocument(zip), "OEBPS/content.opf");

    const auto prepared = Repackager::prepare(src, true);
    EXPECT_TRUE(ZipReader(prepared.upload_path).has("OEBPS/rm_cover.xhtml"));
}

TEST_F(RepackagerTest, PackageAtArchiveRoot) {
    const auto src = writeEpub(dir / "book.epub", {.opf_dir = ""});
    const auto prepared = Repackager::prepare(src, true);
    EXPECT_TRUE(ZipReader(prepared.upload_path).has("rm_cover.xhtml"));
}

TEST_F(RepackagerTest, MalformedPackageDocumentIsSwallowed) {
    const auto src = dir / "book.epub";
    {
        ZipWriter zip(src);
        zip.add("mimetype", "application/epub+zip", Compression::Store);
        zip.add("META-INF/container.xml", containerXml("content.opf"));
        zip.add("content.opf", "<package><manifest><item id=");
        zip.close();
    }

    const auto prepared = Repackager::prepare(src, true);
    ASSERT_TRUE(prepared.owned_temp);
    EXPECT_EQ(ZipReader(prepared.upload_path).read("content.opf"), "<package><manifest><item id=");
}

TEST(CoverInjectorTest, PreservesNamespacePrefixOnNewElements) {
    const EpubOptions opts{.prefix = "opf:"};
    const auto opf = packageDocument(opts);

    const auto patch = CoverInjector::inject(opf, "OEBPS/content.opf",
                                             [](const std::string&) { return std::optional<std::string>{}; });
    ASSERT_TRUE(patch.has_value());
    EXPECT_EQ(patch->page_path, "OEBPS/rm_cover.xhtml");
    EXPECT_NE(patch->package_document.find(R"(<opf:itemref idref="rm-cover-page")"), std::string::npos);
    EXPECT_NE(patch->package_document.find(R"(<opf:item id="rm-cover-page")"), std::string::npos);
    EXPECT_NE(patch->package_document.find("<opf:guide>"), std::string::npos);
    EXPECT_NE(patch->package_document.find(R"(xmlns:opf="http://www.idpf.org/2007/opf")"), std::string::npos);
}

TEST(CoverInjectorTest, UpdatesExistingGuideCoverReference) {
    auto opf = packageDocument({});
    opf.replace(opf.find("</package>"), 10,
                R"(<guide><reference type="cover" title="Old" href="text/ch1.xhtml"/></guide></package>)");

    const auto patch = CoverInjector::inject(opf, "content.opf",
                                             [](const std::string&) { return std::optional<std::string>{"<p/>"}; });
    ASSERT_TRUE(patch.has_value());
    EXPECT_EQ(countOccurrences(patch->package_document, R"(type="cover")"), 1u);
    EXPECT_NE(patch->package_document.find(R"(title="Old" href="rm_cover.xhtml")"), std::string::npos);
    EXPECT_EQ(countOccurrences(patch->package_document, R"(href="text/ch1.xhtml")"), 1u);
}

TEST(CoverInjectorTest, NonImageCoverIsIgnored) {
    auto opf = packageDocument({});
    opf.replace(opf.find("image/jpeg"), 10, "text/plain");
    const auto patch = CoverInjector::inject(opf, "content.opf",
                                             [](const std::string&) { return std::optional<std::string>{}; });
    EXPECT_FALSE(patch.has_value());
}

TEST(CoverInjectorTest, MatchesCoverByFileName) {
    const auto opf = packageDocument({});
    const auto patch = CoverInjector::inject(opf, "OEBPS/content.opf", [](const std::string& path) {
        return path == "OEBPS/text/ch1.xhtml" ? std::optional<std::string>{R"(<img src="/abs/cover.jpg"/>)"}
                                              : std::nullopt;
    });
    EXPECT_FALSE(patch.has_value());
}

TEST(CoverInjectorTest, MalformedXmlThrows) {
    EXPECT_THROW((void)CoverInjector::inject("<package", "content.opf",
                                             [](const std::string&) { return std::optional<std::string>{}; }),
                 std::runtime_error);
}
