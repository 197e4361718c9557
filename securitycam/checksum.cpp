#include "checksum.h"
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>

namespace {

using MdContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdContext newSha256Context() {
    MdContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

std::string finishHex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

} // namespace

std::string sha256File(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for hashing: " + path);
    }

    MdContext ctx = newSha256Context();
    std::vector<char> buffer(64 * 1024);

    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed for " + path);
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing " + path);
    }

    return finishHex(ctx.get());
}

std::string sha256Hex(const std::string& data) {
    MdContext ctx = newSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return finishHex(ctx.get());
}
