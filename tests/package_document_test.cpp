#include "../libinkpress/include/package_document.hpp"
#include "../libinkpress/include/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace inkpress;
using namespace inkpress::test;

namespace {

const char* const kMinimalOpf =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\">\n"
    "  <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\"><dc:title>T</dc:title></metadata>\n"
    "  <manifest>\n"
    "    <item id=\"a\" href=\"a.xhtml\" media-type=\"application/xhtml+xml\"/>\n"
    "  </manifest>\n"
    "%SPINE%"
    "</package>\n";

std::string minimal_opf(const std::string& spine) {
    std::string s = kMinimalOpf;
    s.replace(s.find("%SPINE%"), 7, spine);
    return s;
}

std::vector<std::string> spine_ids(const PackageDocument& pkg) {
    std::vector<std::string> ids;
    for (const auto& ref : pkg.spine()) ids.push_back(ref.idref);
    return ids;
}

} // namespace

TEST(PackageDocument, ParsesManifestAndSpine) {
    TestDir dir;
    const auto opf = write_sample_book(dir.path());
    const auto pkg = PackageDocument::parse(opf);

    EXPECT_EQ(pkg.manifest().size(), 10u);
    EXPECT_EQ(spine_ids(pkg),
              (std::vector<std::string>{"cover-page", "index", "article1", "article2", "article3"}));

    const auto* photo = pkg.find_item("photo");
    ASSERT_NE(photo, nullptr);
    EXPECT_EQ(photo->href, "images/photo.jpg");
    EXPECT_EQ(photo->media_type, "image/jpeg");
    EXPECT_EQ(pkg.resolve(*photo), (opf.parent_path() / "images" / "photo.jpg").lexically_normal());

    ASSERT_NE(pkg.find_item_with_property("nav"), nullptr);
    EXPECT_EQ(pkg.find_item_with_property("nav")->id, "nav");
    ASSERT_NE(pkg.find_item_by_media_type("application/x-dtbncx+xml"), nullptr);
    EXPECT_EQ(pkg.find_item("missing"), nullptr);
}

TEST(PackageDocument, MissingSpineIsMalformed) {
    TestDir dir;
    write_text(dir / "content.opf", minimal_opf(""));
    EXPECT_THROW(PackageDocument::parse(dir / "content.opf"), MalformedPackageError);
}

TEST(PackageDocument, MissingManifestIsMalformed) {
    TestDir dir;
    write_text(dir / "content.opf",
               "<?xml version=\"1.0\"?>\n<package xmlns=\"http://www.idpf.org/2007/opf\"><spine/></package>\n");
    EXPECT_THROW(PackageDocument::parse(dir / "content.opf"), MalformedPackageError);
}

TEST(PackageDocument, DanglingSpineReferenceIsMalformed) {
    TestDir dir;
    write_text(dir / "content.opf", minimal_opf("  <spine><itemref idref=\"nope\"/></spine>\n"));
    try {
        PackageDocument::parse(dir / "content.opf");
        FAIL() << "expected MalformedPackageError";
    } catch (const MalformedPackageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedPackage);
        EXPECT_EQ(e.path(), dir / "content.opf");
        EXPECT_NE(std::string(e.what()).find("nope"), std::string::npos);
    }
}

TEST(PackageDocument, NotXmlIsMalformed) {
    TestDir dir;
    write_text(dir / "content.opf", "this is not xml <<<");
    EXPECT_THROW(PackageDocument::parse(dir / "content.opf"), MalformedPackageError);
}

TEST(PackageDocument, TrimsLeadingSpineEntriesInOrder) {
    TestDir dir;
    auto pkg = PackageDocument::parse(write_sample_book(dir.path()));

    EXPECT_EQ(pkg.remove_leading_spine_entries(2), 2u);
    EXPECT_EQ(spine_ids(pkg), (std::vector<std::string>{"article1", "article2", "article3"}));
    // manifest items stay resolvable
    EXPECT_NE(pkg.find_item("cover-page"), nullptr);
    EXPECT_NE(pkg.find_item("index"), nullptr);

    const std::string xml = pkg.serialize();
    EXPECT_EQ(xml.find("idref=\"cover-page\""), std::string::npos);
    EXPECT_NE(xml.find("id=\"cover-page\""), std::string::npos);
    EXPECT_NE(xml.find("<itemref idref=\"article1\"/>"), std::string::npos);
}

TEST(PackageDocument, TrimmingMoreThanTheSpineEmptiesIt) {
    TestDir dir;
    auto pkg = PackageDocument::parse(write_sample_book(dir.path()));

    EXPECT_EQ(pkg.remove_leading_spine_entries(7), 5u);
    EXPECT_TRUE(pkg.spine().empty());
    EXPECT_EQ(pkg.remove_leading_spine_entries(2), 0u);
    EXPECT_EQ(pkg.manifest().size(), 10u);
}

TEST(PackageDocument, SerializationKeepsNamespacesAndDeclaration) {
    TestDir dir;
    auto pkg = PackageDocument::parse(write_sample_book(dir.path()));
    const std::string xml = pkg.serialize();

    EXPECT_EQ(xml.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>", 0), 0u);
    EXPECT_NE(xml.find("<package xmlns=\"http://www.idpf.org/2007/opf\""), std::string::npos);
    EXPECT_NE(xml.find("xmlns:dc=\"http://purl.org/dc/elements/1.1/\""), std::string::npos);
    EXPECT_NE(xml.find("<dc:title>Daily Briefing</dc:title>"), std::string::npos);
    EXPECT_EQ(xml.find("ns0:"), std::string::npos);
    EXPECT_NE(xml.find("properties=\"cover-image\""), std::string::npos);
}

TEST(PackageDocument, SavedDocumentParsesBackIdentically) {
    TestDir dir;
    const auto opf = write_sample_book(dir.path());
    {
        auto pkg = PackageDocument::parse(opf);
        pkg.remove_leading_spine_entries(2);
        pkg.remove_item("photo");
        ASSERT_TRUE(pkg.add_item({pkg.unique_id("diagnostics"), "_diagnostics.json", "application/json", {}}));
        pkg.save();
    }
    const auto reparsed = PackageDocument::parse(opf);
    EXPECT_EQ(spine_ids(reparsed), (std::vector<std::string>{"article1", "article2", "article3"}));
    EXPECT_EQ(reparsed.find_item("photo"), nullptr);
    const auto* diag = reparsed.find_item("diagnostics");
    ASSERT_NE(diag, nullptr);
    EXPECT_EQ(diag->media_type, "application/json");
    EXPECT_NE(read_text(opf).find("<item id=\"diagnostics\" href=\"_diagnostics.json\" media-type=\"application/json\"/>"),
              std::string::npos);
}

TEST(PackageDocument, RemovingAnItemDropsItsSpineReferences) {
    TestDir dir;
    auto pkg = PackageDocument::parse(write_sample_book(dir.path()));

    EXPECT_TRUE(pkg.remove_item("article2"));
    EXPECT_FALSE(pkg.remove_item("article2"));
    EXPECT_EQ(spine_ids(pkg), (std::vector<std::string>{"cover-page", "index", "article1", "article3"}));

    const auto removed = pkg.remove_items_if([](const ManifestItem& i) {
        return i.media_type.starts_with("image/");
    });
    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(pkg.find_item("cover-image"), nullptr);
}

TEST(PackageDocument, UniqueIdAvoidsCollisions) {
    TestDir dir;
    auto pkg = PackageDocument::parse(write_sample_book(dir.path()));
    EXPECT_EQ(pkg.unique_id("diagnostics"), "diagnostics");
    EXPECT_EQ(pkg.unique_id("photo"), "photo-2");
    EXPECT_FALSE(pkg.add_item({"photo", "x.jpg", "image/jpeg", {}}));
}

TEST(LocatePackageDocument, UsesContainerXml) {
    TestDir dir;
    write_sample_book(dir.path());
    write_text(dir / "other.opf", minimal_opf("  <spine/>\n"));
    EXPECT_EQ(locate_package_document(dir.path()), (dir / "OEBPS" / "content.opf").lexically_normal());
}

TEST(LocatePackageDocument, FallsBackToFirstOpfFile) {
    TestDir dir;
    SampleOptions options;
    options.with_container_xml = false;
    write_sample_book(dir.path(), options);
    EXPECT_EQ(locate_package_document(dir.path()), dir / "OEBPS" / "content.opf");
}

TEST(LocatePackageDocument, NoPackageIsMalformed) {
    TestDir dir;
    write_text(dir / "mimetype", "application/epub+zip");
    EXPECT_THROW(locate_package_document(dir.path()), MalformedPackageError);
}
