#include <span>
#include <array>
#include <vector>
#include <cstdio>

#include "hash.hpp"

// BLAKE3 C API
extern "C"{
    #include "blake3.h"
}

namespace mrac::tools::hash{
    // In-memory BLAKE3 -> init, feed, finalize (no heap)
    std::array<std::uint8_t, 32> blake3_256(const void* data, std::size_t len){
        std::array<std::uint8_t, 32> out{};
        blake3_hasher h;
        blake3_hasher_init(&h);
        blake3_hasher_update(&h, data, len);
        blake3_hasher_finalize(&h, out.data(), out.size());
        return out;
    }

    // Stream BLAKE3 in 64KiB chunks
    std::array<std::uint8_t, 32> blake3_256_file(const char* path){
        std::FILE* f = std::fopen(path, "rb");
        if (!f) return {};
        blake3_hasher h;
        blake3_hasher_init(&h);
        std::vector<unsigned char> buf(1<<16);
        std::size_t n = 0;
        while ((n = std::fread(buf.data(), 1, buf.size(), f)) > 0){
            blake3_hasher_update(&h, buf.data(), n);
        }
        const bool err = std::ferror(f) != 0;
        std::fclose(f);
        if (err) return {};
        std::array<std::uint8_t, 32> out{};
        blake3_hasher_finalize(&h, out.data(), out.size());
        return out;
    }

    std::string to_hex(std::span<const std::uint8_t> bytes){
        static const char* k = "0123456789abcdef";
        std::string s;
        s.resize(bytes.size() * 2);
        for (std::size_t i=0; i<bytes.size(); ++i){
            s[2*i]   = k[(bytes[i] >> 4) & 0xF];
            s[2*i+1] = k[bytes[i] & 0xF];
        }
        return s;
    }
} // namespace mrac::tools::hash
