#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <vector>

namespace batchsync {

namespace {

constexpr size_t kDigestLen = 32;
constexpr size_t kReadChunk = 64 * 1024;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

} // namespace

struct Sha256Hasher::Impl {
    EvpCtxPtr ctx{EVP_MD_CTX_new()};
    bool failed = false;
    bool finalized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        impl_->failed = true;
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || impl_->failed || impl_->finalized || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->failed = true;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || impl_->failed || impl_->finalized) return {};
    impl_->finalized = true;

    std::array<std::uint8_t, kDigestLen> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
        return {};
    }
    return HexEncode(digest);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

std::string Sha256Hex(std::string_view text) {
    return Sha256Hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(kReadChunk);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;
    out_hex = Sha256Hex(reader);
    if (out_hex.empty()) return Result::Fail(-1, "sha256 failed: " + path);
    return Result::Ok();
}

} // namespace batchsync
