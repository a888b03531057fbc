#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace whisp {

/**
 * Incremental SHA-256 over OpenSSL's EVP interface.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    // Returns false once the digest context has failed
    bool update(const uint8_t* data, size_t length);
    bool update(const std::string& str);

    /**
     * Get the final hash as a lowercase hex string
     * @return 64 hex characters, or empty string if hashing failed
     */
    std::string finalize();

    // Convenience function to hash a buffer directly
    static std::string hash(const std::string& input);

private:
    void* ctx_;   // EVP_MD_CTX
    bool ok_;
    bool finalized_;
};

/**
 * Stream a whole file through SHA-256.
 * @param file_path File to hash
 * @param buffer_size Read buffer size in bytes
 * @param error_out Optional error description on failure
 * @return Lowercase hex digest, or empty string on failure
 */
std::string compute_file_checksum(const std::string& file_path,
                                  size_t buffer_size = 64 * 1024,
                                  std::string* error_out = nullptr);

/**
 * Case-insensitive comparison of two hex digests.
 */
bool checksums_equal(const std::string& a, const std::string& b);

} // namespace whisp
