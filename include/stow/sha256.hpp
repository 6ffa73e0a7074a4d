#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace stow {

// Incremental SHA-256 (FIPS 180-4).
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads the message and returns the digest. The object must not be
    // fed again afterwards.
    Digest finalize();

    static std::string hash_hex(const std::string& input);
    // Empty string when the file cannot be read.
    static std::string hash_file(const std::filesystem::path& path);
    static std::string bytes_to_hex(const Digest& bytes);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    uint64_t length_ = 0;
    std::array<uint8_t, 64> pending_{};
    size_t pending_len_ = 0;
};

} // namespace stow
