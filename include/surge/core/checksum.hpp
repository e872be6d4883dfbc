// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace surge::core {

enum class HashAlgo : std::uint8_t {
    sha256,
    sha512,
    md5
};

struct Checksum {
    HashAlgo algo{HashAlgo::sha256};
    std::string hex;

    bool operator==(const Checksum&) const = default;
};

[[nodiscard]] std::string_view to_string(HashAlgo algo) noexcept;
[[nodiscard]] std::expected<HashAlgo, std::error_code> parse_hash_algo(std::string_view name) noexcept;

// Incremental digest over OpenSSL EVP
class Hasher {
public:
    explicit Hasher(HashAlgo algo);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    [[nodiscard]] std::error_code update(std::span<const std::byte> data) noexcept;

    // Lower-case hex digest; the hasher cannot be updated afterwards
    [[nodiscard]] std::expected<std::string, std::error_code> finish() noexcept;

    [[nodiscard]] HashAlgo algo() const noexcept { return algo_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    HashAlgo algo_;
};

[[nodiscard]] std::expected<std::string, std::error_code>
hash_file(const std::filesystem::path& path, HashAlgo algo) noexcept;

// Case-insensitive hex comparison
[[nodiscard]] bool digest_equals(std::string_view a, std::string_view b) noexcept;

} // namespace surge::core
