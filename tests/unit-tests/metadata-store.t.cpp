#include "boost-test.hpp"

#include "core/downloader/MetadataStore.hpp"

#include "temp-dir-fixture.hpp"

#include <algorithm>
#include <set>
#include <system_error>

namespace ferry::core::downloader::tests {

using ferry::tests::TempDirFixture;

class StoreFixture : public TempDirFixture {
public:
    StoreFixture()
        : store(root) {}

    SidecarRecord makeRecord(const std::string& name, uint64_t bytes) const {
        SidecarRecord record;
        record.downloadId = "id-" + name;
        record.url = "https://example.org/" + name;
        record.protocol = "https";
        record.destination = (root / name).string();
        record.etag = "\"abc\"";
        record.expectedSize = 1000;
        record.bytesDownloaded = bytes;
        return record;
    }

    void writePart(const std::string& name, uint64_t bytes) const {
        writeFile(MetadataStore::partPath(root / name), std::string(bytes, 'x'));
    }

public:
    MetadataStore store;
};

BOOST_FIXTURE_TEST_SUITE(TestMetadataStore, StoreFixture)

BOOST_AUTO_TEST_CASE(ArtifactNames)
{
    fs::path destination = root / "dir" / "file.iso";
    BOOST_CHECK_EQUAL(MetadataStore::partPath(destination), root / "dir" / "file.iso.part");
    BOOST_CHECK_EQUAL(MetadataStore::sidecarPath(destination), root / "dir" / "file.iso.meta.json");
}

BOOST_AUTO_TEST_CASE(SaveAndLoad)
{
    SidecarRecord record = makeRecord("file.bin", 250);
    record.lastModified = "Wed, 21 Oct 2015 07:28:00 GMT";
    record.expectedHash = "sha256:" + std::string(64, 'a');
    store.save(record);

    fs::path destination = root / "file.bin";
    BOOST_CHECK(fs::exists(MetadataStore::sidecarPath(destination)));
    BOOST_CHECK(!fs::exists(fs::path(MetadataStore::sidecarPath(destination).string() + ".tmp")));

    auto loaded = store.load(destination);
    BOOST_REQUIRE(loaded);
    BOOST_CHECK_EQUAL(loaded->version, SidecarRecord::kVersion);
    BOOST_CHECK_EQUAL(loaded->downloadId, record.downloadId);
    BOOST_CHECK_EQUAL(loaded->url, record.url);
    BOOST_CHECK_EQUAL(loaded->protocol, "https");
    BOOST_CHECK_EQUAL(loaded->destination, destination.string());
    BOOST_CHECK_EQUAL(loaded->bytesDownloaded, 250);
    BOOST_CHECK_EQUAL(*loaded->expectedSize, 1000);
    BOOST_CHECK_EQUAL(*loaded->etag, "\"abc\"");
    BOOST_CHECK_EQUAL(*loaded->lastModified, *record.lastModified);
    BOOST_CHECK_EQUAL(*loaded->expectedHash, *record.expectedHash);
    BOOST_CHECK(!loaded->finalHash);

    // Overwrite in place
    record.bytesDownloaded = 500;
    store.save(record);
    BOOST_CHECK_EQUAL(store.load(destination)->bytesDownloaded, 500);
}

BOOST_AUTO_TEST_CASE(SidecarSchema)
{
    nlohmann::json j = makeRecord("file.bin", 10);

    BOOST_CHECK_EQUAL(j["version"].get<int>(), 1);
    BOOST_CHECK_EQUAL(j["download_id"].get<std::string>(), "id-file.bin");
    BOOST_CHECK_EQUAL(j["bytes_downloaded"].get<uint64_t>(), 10);
    BOOST_CHECK_EQUAL(j["expected_size"].get<uint64_t>(), 1000);
    BOOST_CHECK(j["final_hash"].is_null());
}

BOOST_AUTO_TEST_CASE(RejectsBadRecords)
{
    nlohmann::json good = makeRecord("file.bin", 10);

    nlohmann::json future = good;
    future["version"] = 2;
    BOOST_CHECK_THROW(future.get<SidecarRecord>(), std::runtime_error);

    nlohmann::json noUrl = good;
    noUrl.erase("url");
    BOOST_CHECK_THROW(noUrl.get<SidecarRecord>(), std::runtime_error);

    nlohmann::json overflow = good;
    overflow["bytes_downloaded"] = 1001;
    BOOST_CHECK_THROW(overflow.get<SidecarRecord>(), std::runtime_error);

    BOOST_CHECK_THROW(nlohmann::json::array().get<SidecarRecord>(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(LoadIgnoresUnreadableSidecars)
{
    BOOST_CHECK(!store.load(root / "absent.bin"));

    writeFile(MetadataStore::sidecarPath(root / "torn.bin"), "{\"version\": 1, \"download_");
    BOOST_CHECK(!store.load(root / "torn.bin"));
}

BOOST_AUTO_TEST_CASE(Discard)
{
    store.save(makeRecord("file.bin", 10));
    writePart("file.bin", 10);
    writeFile(root / "file.bin.meta.json.tmp", "{}");

    store.discard(root / "file.bin");

    BOOST_CHECK(!fs::exists(root / "file.bin.part"));
    BOOST_CHECK(!fs::exists(root / "file.bin.meta.json"));
    BOOST_CHECK(!fs::exists(root / "file.bin.meta.json.tmp"));

    // Nothing left to remove
    BOOST_CHECK_NO_THROW(store.discard(root / "file.bin"));
}

BOOST_AUTO_TEST_CASE(ScanKeepsConsistentPairs)
{
    store.save(makeRecord("good.bin", 100));
    writePart("good.bin", 100);

    writePart("sub/deep.bin", 5);
    store.save(makeRecord("sub/deep.bin", 5));

    // Sidecar without data
    store.save(makeRecord("lonely.bin", 10));

    // Corrupt sidecar with data
    writeFile(MetadataStore::sidecarPath(root / "corrupt.bin"), "not json");
    writePart("corrupt.bin", 3);

    // Interrupted atomic write
    writeFile(root / "good.bin.meta.json.tmp", "{");

    // Data without a sidecar
    writePart("stray.bin", 7);
    writePart("sub/stray.bin", 7);

    RecoveryResult result = store.scan();

    BOOST_CHECK_EQUAL(result.records.size(), 2);
    BOOST_CHECK_EQUAL(result.discarded, 4);
    BOOST_CHECK_EQUAL(result.staleTempFiles, 1);

    std::vector<std::string> ids;
    for (const auto& record : result.records) {
        ids.push_back(record.downloadId);
    }
    std::sort(ids.begin(), ids.end());
    BOOST_CHECK_EQUAL(ids[0], "id-good.bin");
    BOOST_CHECK_EQUAL(ids[1], "id-sub/deep.bin");

    BOOST_CHECK(fs::exists(root / "good.bin.part"));
    BOOST_CHECK(!fs::exists(root / "good.bin.meta.json.tmp"));
    BOOST_CHECK(!fs::exists(root / "lonely.bin.meta.json"));
    BOOST_CHECK(!fs::exists(root / "corrupt.bin.meta.json"));
    BOOST_CHECK(!fs::exists(root / "corrupt.bin.part"));
    BOOST_CHECK(!fs::exists(root / "stray.bin.part"));
    BOOST_CHECK(!fs::exists(root / "sub" / "stray.bin.part"));
    BOOST_CHECK(fs::exists(root / "sub" / "deep.bin.part"));
}

BOOST_AUTO_TEST_CASE(ScanLeavesOwnedDestinations)
{
    // A task that opened its data file but has not written a sidecar yet
    writePart("fresh.bin", 0);
    writeFile(root / "fresh.bin.meta.json.tmp", "{");

    // A task whose sidecar disagrees with the data it is still writing
    store.save(makeRecord("busy.bin", 10));

    writePart("orphan.bin", 3);

    std::set<fs::path> owned{root / "fresh.bin", root / "busy.bin"};
    RecoveryResult result = store.scan([&](const fs::path& destination) {
        return owned.count(destination) > 0;
    });

    BOOST_CHECK(result.records.empty());
    BOOST_CHECK_EQUAL(result.discarded, 1);
    BOOST_CHECK_EQUAL(result.staleTempFiles, 0);

    BOOST_CHECK(fs::exists(root / "fresh.bin.part"));
    BOOST_CHECK(fs::exists(root / "fresh.bin.meta.json.tmp"));
    BOOST_CHECK(fs::exists(root / "busy.bin.meta.json"));
    BOOST_CHECK(!fs::exists(root / "orphan.bin.part"));
}

BOOST_AUTO_TEST_CASE(ScanOfMissingRoot)
{
    MetadataStore missing(root / "does-not-exist");
    RecoveryResult result = missing.scan();
    BOOST_CHECK(result.records.empty());
    BOOST_CHECK_EQUAL(result.discarded, 0);
}

BOOST_AUTO_TEST_CASE(ResolveDestination)
{
    auto relative = store.resolveDestination("a/b/../c.bin");
    BOOST_REQUIRE(relative);
    BOOST_CHECK_EQUAL(*relative, root / "a" / "c.bin");

    auto absolute = store.resolveDestination((root / "x.bin").string());
    BOOST_REQUIRE(absolute);
    BOOST_CHECK_EQUAL(*absolute, root / "x.bin");

    BOOST_CHECK(!store.resolveDestination(""));
    BOOST_CHECK(!store.resolveDestination("   "));
    BOOST_CHECK(!store.resolveDestination("."));
    BOOST_CHECK(!store.resolveDestination("../outside.bin"));
    BOOST_CHECK(!store.resolveDestination("a/../../outside.bin"));
    BOOST_CHECK(!store.resolveDestination("/etc/passwd"));
    BOOST_CHECK(!store.resolveDestination(root.string() + "-sibling/file.bin"));
}

BOOST_AUTO_TEST_CASE(ResolveThroughSymlink)
{
    fs::path outside = root.parent_path() / (root.filename().string() + "-outside");
    fs::create_directories(outside);
    fs::create_directory_symlink(outside, root / "link");

    BOOST_CHECK(!store.resolveDestination("link/file.bin"));

    std::error_code ec;
    fs::remove_all(outside, ec);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TestPartFile, TempDirFixture)

BOOST_AUTO_TEST_CASE(AppendAndSize)
{
    fs::path path = root / "data.part";
    {
        PartFile part(path);
        BOOST_CHECK_EQUAL(part.size(), 0);

        std::string first = "hello ";
        std::string second = "world";
        part.append(first.data(), first.size());
        part.append(second.data(), second.size());
        part.sync();

        BOOST_CHECK_EQUAL(part.size(), 11);
        part.close();
    }
    BOOST_CHECK_EQUAL(readFile(path), "hello world");

    // Reopening appends after existing bytes
    PartFile again(path);
    again.append("!", 1);
    BOOST_CHECK_EQUAL(again.size(), 12);
}

BOOST_AUTO_TEST_CASE(ExclusiveLock)
{
    fs::path path = root / "locked.part";
    PartFile owner(path);

    BOOST_CHECK_THROW(PartFile intruder(path), std::system_error);

    owner.close();
    BOOST_CHECK_NO_THROW(PartFile next(path));
}

BOOST_AUTO_TEST_CASE(MissingDirectory)
{
    BOOST_CHECK_THROW(PartFile part(root / "no" / "such" / "dir.part"), std::system_error);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace ferry::core::downloader::tests
