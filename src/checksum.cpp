#include "checksum.h"
#include "fs.h"

#include <openssl/evp.h>
#include <cctype>

namespace whisp {

namespace {

std::string to_hex(const unsigned char* data, unsigned int length) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        result += hex[(data[i] >> 4) & 0xF];
        result += hex[data[i] & 0xF];
    }
    return result;
}

} // namespace

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()), ok_(false), finalized_(false) {
    if (ctx_) {
        ok_ = EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) == 1;
    }
}

Sha256::~Sha256() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

bool Sha256::update(const uint8_t* data, size_t length) {
    if (!ok_ || finalized_) {
        return false;
    }
    if (length == 0) {
        return true;
    }
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, length) != 1) {
        ok_ = false;
    }
    return ok_;
}

bool Sha256::update(const std::string& str) {
    return update(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

std::string Sha256::finalize() {
    if (!ok_ || finalized_) {
        return "";
    }
    finalized_ = true;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), digest, &length) != 1) {
        ok_ = false;
        return "";
    }
    return to_hex(digest, length);
}

std::string Sha256::hash(const std::string& input) {
    Sha256 sha;
    sha.update(input);
    return sha.finalize();
}

std::string compute_file_checksum(const std::string& file_path, size_t buffer_size, std::string* error_out) {
    File file = File::open_read(file_path, error_out);
    if (!file.is_open()) {
        return "";
    }

    if (buffer_size == 0) {
        buffer_size = 64 * 1024;
    }
    std::vector<uint8_t> buffer(buffer_size);

    Sha256 sha;
    for (;;) {
        int64_t n = file.read(buffer.data(), buffer.size(), error_out);
        if (n < 0) {
            return "";
        }
        if (n == 0) {
            break;
        }
        if (!sha.update(buffer.data(), static_cast<size_t>(n))) {
            if (error_out) *error_out = "digest update failed for " + file_path;
            return "";
        }
    }

    std::string digest = sha.finalize();
    if (digest.empty() && error_out) {
        *error_out = "digest finalization failed for " + file_path;
    }
    return digest;
}

bool checksums_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace whisp
