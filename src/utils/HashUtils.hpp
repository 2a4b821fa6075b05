#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace ferry::utils {

enum class HashAlgorithm {
    Sha1,
    Sha256
};

/**
 * Incremental digest over OpenSSL EVP.
 */
class Hasher {
public:
    explicit Hasher(HashAlgorithm algorithm)
        : m_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!m_ctx) {
            throw std::runtime_error("Failed to allocate digest context");
        }
        const EVP_MD* md = algorithm == HashAlgorithm::Sha1 ? EVP_sha1() : EVP_sha256();
        if (EVP_DigestInit_ex(m_ctx.get(), md, nullptr) != 1) {
            throw std::runtime_error("Failed to initialize digest");
        }
    }

    void update(const void* data, size_t size) {
        if (size == 0) return;
        if (EVP_DigestUpdate(m_ctx.get(), data, size) != 1) {
            throw std::runtime_error("Digest update failed");
        }
    }

    /**
     * Finish the digest
     * @return Lowercase hex string
     */
    std::string finalHex() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(m_ctx.get(), hash, &hashLen) != 1) {
            throw std::runtime_error("Digest finalization failed");
        }
        return toHex(hash, hashLen);
    }

    static std::string toHex(const unsigned char* data, size_t len) {
        std::ostringstream oss;
        for (size_t i = 0; i < len; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> m_ctx;
};

class HashUtils {
public:
    /**
     * Digest a file in 1 MiB reads
     * @throws std::runtime_error if the file cannot be opened or read
     */
    static std::string fileDigest(const std::filesystem::path& filePath, HashAlgorithm algorithm) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open " + filePath.string() + " for hashing");
        }

        Hasher hasher(algorithm);
        std::vector<char> buffer(1024 * 1024);
        while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
            hasher.update(buffer.data(), static_cast<size_t>(file.gcount()));
        }
        if (file.bad()) {
            throw std::runtime_error("Read error while hashing " + filePath.string());
        }
        return hasher.finalHex();
    }

    static std::string sha256File(const std::filesystem::path& filePath) {
        return fileDigest(filePath, HashAlgorithm::Sha256);
    }

    static std::string sha1File(const std::filesystem::path& filePath) {
        return fileDigest(filePath, HashAlgorithm::Sha1);
    }

    static std::string sha256String(const std::string& data) {
        Hasher hasher(HashAlgorithm::Sha256);
        hasher.update(data.data(), data.size());
        return hasher.finalHex();
    }

    static std::string sha1String(const std::string& data) {
        Hasher hasher(HashAlgorithm::Sha1);
        hasher.update(data.data(), data.size());
        return hasher.finalHex();
    }

    static std::optional<HashAlgorithm> algorithmFromName(const std::string& name) {
        if (name == "sha256" || name == "sha-256") return HashAlgorithm::Sha256;
        if (name == "sha1" || name == "sha-1") return HashAlgorithm::Sha1;
        return std::nullopt;
    }

    static const char* algorithmName(HashAlgorithm algorithm) {
        return algorithm == HashAlgorithm::Sha1 ? "sha1" : "sha256";
    }

    /**
     * Hex digest length for an algorithm
     */
    static size_t hexLength(HashAlgorithm algorithm) {
        return algorithm == HashAlgorithm::Sha1 ? 40 : 64;
    }
};

} // namespace ferry::utils
