/**
 * IntegrityVerifier.cpp
 */

#include "IntegrityVerifier.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <cctype>

namespace ferry::core::downloader {

using utils::HashAlgorithm;
using utils::HashUtils;
using utils::StringUtils;

std::string ExpectedDigest::toString() const {
    return std::string(HashUtils::algorithmName(algorithm)) + ":" + hex;
}

std::optional<ExpectedDigest> IntegrityVerifier::parse(const std::string& text) {
    std::string value = StringUtils::toLower(StringUtils::trim(text));
    if (value.empty()) {
        return std::nullopt;
    }

    ExpectedDigest digest;
    auto colon = value.find(':');
    if (colon != std::string::npos) {
        auto algorithm = HashUtils::algorithmFromName(value.substr(0, colon));
        if (!algorithm) {
            return std::nullopt;
        }
        digest.algorithm = *algorithm;
        digest.hex = value.substr(colon + 1);
    } else {
        digest.hex = value;
    }

    if (digest.hex.size() != HashUtils::hexLength(digest.algorithm)) {
        return std::nullopt;
    }
    for (char c : digest.hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return digest;
}

VerificationResult IntegrityVerifier::verify(const std::filesystem::path& file,
                                             const std::optional<ExpectedDigest>& expected) {
    HashAlgorithm algorithm = expected ? expected->algorithm : HashAlgorithm::Sha256;

    VerificationResult result;
    result.algorithm = HashUtils::algorithmName(algorithm);
    result.actual = HashUtils::fileDigest(file, algorithm);

    if (expected) {
        result.expected = expected->hex;
        result.matched = StringUtils::equalsIgnoreCase(result.actual, expected->hex);
    }

    LOG_DEBUG("{} of {}: {}{}", result.algorithm, file.string(), result.actual,
              result.matched ? "" : " (mismatch)");
    return result;
}

bool IntegrityVerifier::matches(const std::filesystem::path& file, const ExpectedDigest& expected) {
    try {
        return verify(file, expected).matched;
    } catch (const std::runtime_error& e) {
        LOG_WARN("Cannot hash {}: {}", file.string(), e.what());
        return false;
    }
}

} // namespace ferry::core::downloader
