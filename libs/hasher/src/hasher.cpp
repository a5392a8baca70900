#include "fidx/hasher.h"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace fidx::hasher {

namespace {

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestCtx new_sha256_ctx() {
    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx)
        throw std::runtime_error("hasher: EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("hasher: EVP_DigestInit_ex failed");
    return ctx;
}

} // namespace

std::string to_hex(const uint8_t* data, size_t size) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string sha256_hex(std::istream& r) {
    auto ctx = new_sha256_ctx();

    std::vector<char> buf(chunk_size);
    while (r) {
        r.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = r.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1)
            throw std::runtime_error("hasher: EVP_DigestUpdate failed");
    }
    // eof sets failbit too; only badbit or a failure before eof means a short read.
    if (r.bad() || !r.eof())
        throw std::runtime_error("hasher: read error before end of stream");

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1)
        throw std::runtime_error("hasher: EVP_DigestFinal_ex failed");

    return to_hex(md, md_len);
}

std::string hash_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw std::runtime_error("hasher: cannot open " + path.string());
    try {
        return sha256_hex(f);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string(e.what()) + ": " + path.string());
    }
}

} // namespace fidx::hasher
