#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace codec {
    // zlib
    std::string compress(const std::string& input, int level);
    std::string decompress(const std::string& input, std::size_t raw_len);
    // One zlib stream of unknown length (legacy single-stream blobs).
    std::string inflate_stream(const std::string& input);
    uint32_t crc32(const std::string& data);

    // Splits raw record bytes into blocks of block_bytes and compresses each:
    // u32 block_count, then per block u32 raw_len | u32 comp_len | bytes.
    std::string encode_blocks(const std::string& raw, std::size_t block_bytes, int level);
    // Block lengths are checked against max_block_bytes and the running total
    // against expected_bytes before anything is inflated.
    std::string decode_blocks(const std::string& blob, std::size_t max_block_bytes,
                              std::size_t expected_bytes);

    // Lower-case hex SHA-256.
    std::string sha256_hex(const std::string& data);
}
