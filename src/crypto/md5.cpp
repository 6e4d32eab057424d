#include "crypto/md5.hpp"

#include "util/hex.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace ngdp {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitMd5(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) == 1;
}

bool UpdateMd5(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool FinalMd5(EvpCtx& ctx, Md5Digest& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

} // namespace

struct Md5Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool failed = false;
    bool finalized = false;
};

Md5Hasher::Md5Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->initialized = InitMd5(impl_->ctx);
}

Md5Hasher::Md5Hasher(Md5Hasher&&) noexcept = default;
Md5Hasher& Md5Hasher::operator=(Md5Hasher&&) noexcept = default;
Md5Hasher::~Md5Hasher() = default;

void Md5Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->finalized || impl_->failed) return;
    if (!UpdateMd5(impl_->ctx, data)) {
        impl_->failed = true;
    }
}

bool Md5Hasher::Final(Md5Digest& out) {
    if (!impl_ || !impl_->initialized || impl_->finalized || impl_->failed) return false;
    impl_->finalized = true;
    return FinalMd5(impl_->ctx, out);
}

Md5Digest Md5(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    Md5Digest digest{};
    if (!InitMd5(ctx) || !UpdateMd5(ctx, data) || !FinalMd5(ctx, digest)) {
        // Only reachable when libcrypto itself is broken.
        throw std::runtime_error("EVP md5 failed");
    }
    return digest;
}

std::string Md5Hex(std::span<const std::uint8_t> data) {
    return HexEncode(Md5(data));
}

} // namespace ngdp
