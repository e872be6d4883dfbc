// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/checksum.hpp>
#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include <openssl/evp.h>
#include <array>
#include <cctype>
#include <fstream>
#include <vector>

namespace surge::core {

namespace {

const EVP_MD* resolve_algo(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::sha256: return EVP_sha256();
        case HashAlgo::sha512: return EVP_sha512();
        case HashAlgo::md5:    return EVP_md5();
    }
    return EVP_sha256();
}

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(len * 2, '\0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX[(bytes[i] >> 4) & 0xF];
        out[2 * i + 1] = HEX[bytes[i] & 0xF];
    }
    return out;
}

} // namespace

struct Hasher::Impl {
    EVP_MD_CTX* ctx{nullptr};
    bool finished{false};

    Impl() : ctx(EVP_MD_CTX_new()) {}
    ~Impl() { if (ctx) EVP_MD_CTX_free(ctx); }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

std::string_view to_string(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::sha256: return "sha256";
        case HashAlgo::sha512: return "sha512";
        case HashAlgo::md5:    return "md5";
    }
    return "sha256";
}

std::expected<HashAlgo, std::error_code> parse_hash_algo(std::string_view name) noexcept {
    std::string lower;
    for (char c : name) {
        if (c == '-') continue;  // "sha-256"
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "sha256") return HashAlgo::sha256;
    if (lower == "sha512") return HashAlgo::sha512;
    if (lower == "md5") return HashAlgo::md5;
    return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
}

//=============================================================================
// Hasher
//=============================================================================

Hasher::Hasher(HashAlgo algo)
    : impl_(std::make_unique<Impl>())
    , algo_(algo) {
    if (impl_->ctx && EVP_DigestInit_ex(impl_->ctx, resolve_algo(algo), nullptr) != 1) {
        EVP_MD_CTX_free(impl_->ctx);
        impl_->ctx = nullptr;
    }
}

Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

std::error_code Hasher::update(std::span<const std::byte> data) noexcept {
    if (!impl_ || !impl_->ctx || impl_->finished) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx, data.data(), data.size()) != 1) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    return {};
}

std::expected<std::string, std::error_code> Hasher::finish() noexcept {
    if (!impl_ || !impl_->ctx || impl_->finished) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }
    impl_->finished = true;

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned md_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, md.data(), &md_len) != 1) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }
    try {
        return to_hex_lower(md.data(), md_len);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::allocation_failed));
    }
}

//=============================================================================
// File helpers
//=============================================================================

std::expected<std::string, std::error_code>
hash_file(const std::filesystem::path& path, HashAlgo algo) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        Hasher hasher(algo);
        std::vector<char> buffer(HASH_BUFFER_SIZE);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto n = static_cast<std::size_t>(file.gcount());
            if (n == 0) break;
            if (auto ec = hasher.update(std::as_bytes(std::span(buffer.data(), n)))) {
                return std::unexpected(ec);
            }
        }
        if (file.bad()) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
        return hasher.finish();
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::allocation_failed));
    }
}

bool digest_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace surge::core
