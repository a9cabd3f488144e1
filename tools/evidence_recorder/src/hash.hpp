#pragma once

#include <span>
#include <array>
#include <string>
#include <cstddef>
#include <cstdint>

namespace mrac::tools::hash{

    // // BLAKE3-256 over memory or a streamed file; empty digest when the file can't be read
    std::array<std::uint8_t, 32> blake3_256(const void* data, std::size_t len);
    std::array<std::uint8_t, 32> blake3_256_file(const char* path);

    // // lowercase hex
    std::string to_hex(std::span<const std::uint8_t> bytes);
} // namespace mrac::tools::hash
