#include "../../boost-test.hpp"

#include "utils/FileUtils.hpp"
#include "utils/HashUtils.hpp"
#include "utils/JsonUtils.hpp"
#include "utils/StringUtils.hpp"

#include "../temp-dir-fixture.hpp"

#include <set>

namespace ferry::utils::tests {

using ferry::tests::TempDirFixture;

BOOST_FIXTURE_TEST_SUITE(TestFileUtils, TempDirFixture)

BOOST_AUTO_TEST_CASE(Queries)
{
    fs::path file = root / "data.bin";
    writeFile(file, "12345");

    BOOST_CHECK(FileUtils::fileExists(file));
    BOOST_CHECK(!FileUtils::fileExists(root));
    BOOST_CHECK(FileUtils::directoryExists(root));
    BOOST_CHECK_EQUAL(*FileUtils::getFileSize(file), 5);
    BOOST_CHECK(!FileUtils::getFileSize(root / "missing"));

    auto space = FileUtils::availableSpace(root);
    BOOST_REQUIRE(space);
    BOOST_CHECK_GT(*space, 0);
}

BOOST_AUTO_TEST_CASE(PathContainment)
{
    BOOST_CHECK(FileUtils::isPathWithin(root / "a" / "b.bin", root));
    BOOST_CHECK(FileUtils::isPathWithin(root / "a" / ".." / "b.bin", root));
    BOOST_CHECK(!FileUtils::isPathWithin(root / ".." / "b.bin", root));
    BOOST_CHECK(!FileUtils::isPathWithin(root, root));
    BOOST_CHECK(!FileUtils::isPathWithin(root.string() + "x/b.bin", root));

    BOOST_CHECK_EQUAL(FileUtils::appendSuffix(root / "f.iso", ".part"), root / "f.iso.part");
}

BOOST_AUTO_TEST_CASE(AtomicWrite)
{
    fs::path file = root / "state.json";
    FileUtils::writeFileAtomic(file, "first");
    FileUtils::writeFileAtomic(file, "second");

    BOOST_CHECK_EQUAL(readFile(file), "second");
    BOOST_CHECK(!fs::exists(root / "state.json.tmp"));

    BOOST_CHECK_THROW(FileUtils::writeFileAtomic(root / "missing" / "state.json", "x"), std::exception);
}

BOOST_AUTO_TEST_CASE(MoveAndDelete)
{
    fs::path from = root / "from.part";
    fs::path to = root / "to.bin";
    writeFile(from, "payload");
    writeFile(to, "old");

    FileUtils::moveFile(from, to);
    BOOST_CHECK(!fs::exists(from));
    BOOST_CHECK_EQUAL(readFile(to), "payload");

    std::error_code ec;
    BOOST_CHECK(FileUtils::deleteFile(to, ec));
    BOOST_CHECK(!ec);
    BOOST_CHECK(!FileUtils::deleteFile(to, ec));
    BOOST_CHECK(!ec);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TestHashUtils)

BOOST_AUTO_TEST_CASE(KnownVectors)
{
    BOOST_CHECK_EQUAL(HashUtils::sha256String("abc"),
                      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_CHECK_EQUAL(HashUtils::sha256String(""),
                      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK_EQUAL(HashUtils::sha1String("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

BOOST_AUTO_TEST_CASE(IncrementalMatchesOneShot)
{
    Hasher hasher(HashAlgorithm::Sha256);
    hasher.update("a", 1);
    hasher.update("", 0);
    hasher.update("bc", 2);
    BOOST_CHECK_EQUAL(hasher.finalHex(), HashUtils::sha256String("abc"));
}

BOOST_FIXTURE_TEST_CASE(FileDigest, TempDirFixture)
{
    std::string payload = makePayload(3 * 1024 * 1024 + 17, 3);
    writeFile(root / "big.bin", payload);

    BOOST_CHECK_EQUAL(HashUtils::sha256File(root / "big.bin"), HashUtils::sha256String(payload));
    BOOST_CHECK_EQUAL(HashUtils::sha1File(root / "big.bin"), HashUtils::sha1String(payload));
    BOOST_CHECK_THROW(HashUtils::sha256File(root / "missing"), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TestStringUtils)

BOOST_AUTO_TEST_CASE(Basics)
{
    BOOST_CHECK_EQUAL(StringUtils::trim("  a b \n"), "a b");
    BOOST_CHECK_EQUAL(StringUtils::trim("   "), "");
    BOOST_CHECK_EQUAL(StringUtils::toLower("ETag"), "etag");
    BOOST_CHECK(StringUtils::startsWith("W/\"x\"", "W/"));
    BOOST_CHECK(StringUtils::endsWith("a.meta.json", ".meta.json"));
    BOOST_CHECK(!StringUtils::endsWith("json", ".meta.json"));
    BOOST_CHECK(StringUtils::equalsIgnoreCase("ABC", "abc"));
    BOOST_CHECK_EQUAL(StringUtils::formatBytes(512), "512 B");
    BOOST_CHECK_EQUAL(StringUtils::formatBytes(1536), "1.5 KB");
}

BOOST_AUTO_TEST_CASE(Uuid)
{
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string uuid = StringUtils::generateUUID();
        BOOST_CHECK(StringUtils::isValidUUID(uuid));
        seen.insert(uuid);
    }
    BOOST_CHECK_EQUAL(seen.size(), 100);
    BOOST_CHECK(!StringUtils::isValidUUID("not-a-uuid"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TestJsonUtils)

BOOST_AUTO_TEST_CASE(OptionalFields)
{
    auto j = JsonUtils::parse(R"({"etag": "\"v1\"", "size": 10, "bad": "ten", "none": null})");
    BOOST_REQUIRE(j);

    BOOST_CHECK_EQUAL(*JsonUtils::getOptionalString(*j, "etag"), "\"v1\"");
    BOOST_CHECK_EQUAL(*JsonUtils::getOptionalUInt64(*j, "size"), 10);
    BOOST_CHECK(!JsonUtils::getOptionalUInt64(*j, "bad"));
    BOOST_CHECK(!JsonUtils::getOptionalString(*j, "none"));
    BOOST_CHECK(!JsonUtils::getOptionalString(*j, "absent"));
    BOOST_CHECK_EQUAL(JsonUtils::getUInt64(*j, "absent", 7), 7);

    JsonUtils::setOptional(*j, "extra", std::optional<std::string>());
    BOOST_CHECK((*j)["extra"].is_null());
    JsonUtils::setOptional(*j, "extra", std::optional<std::string>("x"));
    BOOST_CHECK_EQUAL((*j)["extra"].get<std::string>(), "x");

    BOOST_CHECK(!JsonUtils::parse("{broken"));
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace ferry::utils::tests
