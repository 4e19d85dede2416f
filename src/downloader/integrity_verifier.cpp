/*
 * dlcore/src/downloader/integrity_verifier.cpp
 *
 * Streaming digest via OpenSSL EVP (SHA-256, SHA-512, MD5).
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns a Checksum { algo, hex } and re-initializes the context.
 */

#include <dlcore/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace dlcore::downloader {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Md5:
            return EVP_md5();
    }
    return EVP_sha256();
}

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() { reset(HashAlgo::Sha256); }
    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        algo_ = algo;
        ctx_.reset(EVP_MD_CTX_new());
        if (ctx_ && EVP_DigestInit_ex(ctx_.get(), resolve_algo(algo_), nullptr) != 1) {
            // Leave ctx null; finalize() then yields an empty digest that never matches
            ctx_.reset();
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!ctx_ || data.empty())
            return;
        if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            ctx_.reset();
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = algo_;
        if (ctx_) {
            std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
            unsigned md_len = 0;
            if (EVP_DigestFinal_ex(ctx_.get(), md_buf.data(), &md_len) == 1) {
                out.hex = to_hex_lower(md_buf.data(), md_len);
            }
        }
        reset(algo_);
        return out;
    }

private:
    HashAlgo algo_{HashAlgo::Sha256};
    EvpMdCtxPtr ctx_;
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

Result<Checksum> computeFileChecksum(const std::filesystem::path& path, HashAlgo algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::DiskError, "Cannot open for hashing: " + path.string()};
    }
    auto verifier = makeIntegrityVerifier();
    verifier->reset(algo);
    std::vector<char> buf(DEFAULT_CHUNK_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto n = in.gcount();
        if (n > 0) {
            verifier->update(std::as_bytes(std::span<const char>(buf.data(),
                                                                 static_cast<std::size_t>(n))));
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::DiskError, "Read failed while hashing: " + path.string()};
    }
    auto sum = verifier->finalize();
    if (sum.hex.empty()) {
        return Error{ErrorCode::InternalError, "Digest computation failed"};
    }
    return sum;
}

} // namespace dlcore::downloader
