#include "boost-test.hpp"

#include "core/downloader/IntegrityVerifier.hpp"

#include "temp-dir-fixture.hpp"

namespace ferry::core::downloader::tests {

namespace fs = std::filesystem;
using ferry::tests::TempDirFixture;
using utils::HashAlgorithm;
using utils::HashUtils;

namespace {

// SHA-256 and SHA-1 of "abc"
const std::string kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const std::string kAbcSha1 = "a9993e364706816aba3e25717850c26c9cd0d89d";

} // namespace

BOOST_AUTO_TEST_SUITE(TestIntegrityVerifier)

BOOST_AUTO_TEST_CASE(ParseForms)
{
    auto prefixed = IntegrityVerifier::parse("sha256:" + kAbcSha256);
    BOOST_REQUIRE(prefixed);
    BOOST_CHECK(prefixed->algorithm == HashAlgorithm::Sha256);
    BOOST_CHECK_EQUAL(prefixed->hex, kAbcSha256);
    BOOST_CHECK_EQUAL(prefixed->toString(), "sha256:" + kAbcSha256);

    auto bare = IntegrityVerifier::parse(kAbcSha256);
    BOOST_REQUIRE(bare);
    BOOST_CHECK(bare->algorithm == HashAlgorithm::Sha256);

    auto sha1 = IntegrityVerifier::parse("SHA1:" + kAbcSha1);
    BOOST_REQUIRE(sha1);
    BOOST_CHECK(sha1->algorithm == HashAlgorithm::Sha1);
    BOOST_CHECK_EQUAL(sha1->toString(), "sha1:" + kAbcSha1);

    std::string upper = "  SHA256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD ";
    auto normalized = IntegrityVerifier::parse(upper);
    BOOST_REQUIRE(normalized);
    BOOST_CHECK_EQUAL(normalized->hex, kAbcSha256);
}

BOOST_AUTO_TEST_CASE(ParseRejects)
{
    BOOST_CHECK(!IntegrityVerifier::parse(""));
    BOOST_CHECK(!IntegrityVerifier::parse("sha256:"));
    BOOST_CHECK(!IntegrityVerifier::parse("md5:900150983cd24fb0d6963f7d28e17f72"));
    BOOST_CHECK(!IntegrityVerifier::parse("sha256:" + kAbcSha1));
    BOOST_CHECK(!IntegrityVerifier::parse(kAbcSha256.substr(1) + "g"));
    BOOST_CHECK(!IntegrityVerifier::parse(kAbcSha256 + "00"));
}

BOOST_FIXTURE_TEST_CASE(VerifyFile, TempDirFixture)
{
    fs::path file = root / "abc.txt";
    writeFile(file, "abc");

    VerificationResult computed = IntegrityVerifier::verify(file, std::nullopt);
    BOOST_CHECK(computed.matched);
    BOOST_CHECK_EQUAL(computed.algorithm, "sha256");
    BOOST_CHECK_EQUAL(computed.actual, kAbcSha256);
    BOOST_CHECK(computed.expected.empty());

    VerificationResult good = IntegrityVerifier::verify(file, IntegrityVerifier::parse("sha1:" + kAbcSha1));
    BOOST_CHECK(good.matched);
    BOOST_CHECK_EQUAL(good.actual, kAbcSha1);

    auto wrong = IntegrityVerifier::parse(HashUtils::sha256String("abd"));
    VerificationResult bad = IntegrityVerifier::verify(file, wrong);
    BOOST_CHECK(!bad.matched);
    BOOST_CHECK_EQUAL(bad.expected, wrong->hex);
    BOOST_CHECK_EQUAL(bad.actual, kAbcSha256);

    BOOST_CHECK(IntegrityVerifier::matches(file, *IntegrityVerifier::parse(kAbcSha256)));
    BOOST_CHECK(!IntegrityVerifier::matches(file, *wrong));
}

BOOST_FIXTURE_TEST_CASE(UnreadableFile, TempDirFixture)
{
    fs::path missing = root / "missing.bin";
    BOOST_CHECK_THROW(IntegrityVerifier::verify(missing, std::nullopt), std::runtime_error);
    BOOST_CHECK(!IntegrityVerifier::matches(missing, *IntegrityVerifier::parse(kAbcSha256)));
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace ferry::core::downloader::tests
