#pragma once

/**
 * IntegrityVerifier.hpp
 *
 * Whole-file digest check for finished transfers.
 */

#include "../../utils/HashUtils.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ferry::core::downloader {

/**
 * Parsed "<algo>:<hex>" expectation
 */
struct ExpectedDigest {
    utils::HashAlgorithm algorithm{utils::HashAlgorithm::Sha256};
    std::string hex;    // Lowercase

    std::string toString() const;
};

struct VerificationResult {
    bool matched{true};
    std::string algorithm;
    std::string actual;     // Lowercase hex of the file
    std::string expected;   // Empty when nothing was expected
};

class IntegrityVerifier {
public:
    /**
     * Parse "sha256:<hex>", "sha1:<hex>" or bare hex (SHA-256)
     * @return nullopt for an unknown algorithm or malformed hex
     */
    static std::optional<ExpectedDigest> parse(const std::string& text);

    /**
     * Digest the file and compare
     * @param expected Parsed expectation; without one the SHA-256 is
     *                 computed and always reported as matched
     * @throws std::runtime_error if the file cannot be read
     */
    static VerificationResult verify(const std::filesystem::path& file,
                                     const std::optional<ExpectedDigest>& expected);

    /**
     * Cheap check used to recognise an already present destination
     */
    static bool matches(const std::filesystem::path& file, const ExpectedDigest& expected);
};

} // namespace ferry::core::downloader
