#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <zlib.h>
#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace codec {

std::string compress(const std::string& input, int level) {
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::string out(bound, '\0');
    int rc = compress2(reinterpret_cast<Bytef*>(&out[0]), &bound,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()), level);
    if (rc != Z_OK) {
        throw std::runtime_error("zlib compress2 failed: " + std::to_string(rc));
    }
    out.resize(bound);
    return out;
}

std::string decompress(const std::string& input, std::size_t raw_len) {
    std::string out(raw_len, '\0');
    uLongf dest_len = static_cast<uLongf>(raw_len);
    int rc = uncompress(reinterpret_cast<Bytef*>(&out[0]), &dest_len,
                        reinterpret_cast<const Bytef*>(input.data()),
                        static_cast<uLong>(input.size()));
    if (rc != Z_OK || dest_len != raw_len) {
        throw StorageIntegrityError("zlib uncompress failed: " + std::to_string(rc));
    }
    return out;
}

std::string inflate_stream(const std::string& input) {
    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        throw std::runtime_error("inflateInit failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string out;
    char buffer[32768];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            throw StorageIntegrityError("zlib inflate failed: " + std::to_string(ret));
        }
        out.append(buffer, sizeof(buffer) - zs.avail_out);
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw StorageIntegrityError("Truncated zlib stream");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return out;
}

uint32_t crc32(const std::string& data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data()),
                  static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

std::string encode_blocks(const std::string& raw, std::size_t block_bytes, int level) {
    if (block_bytes == 0) {
        throw std::invalid_argument("block size must be positive");
    }
    std::string out;
    uint32_t count = static_cast<uint32_t>((raw.size() + block_bytes - 1) / block_bytes);
    util::put_u32(out, count);
    for (std::size_t off = 0; off < raw.size(); off += block_bytes) {
        auto chunk = raw.substr(off, block_bytes);
        auto packed = compress(chunk, level);
        util::put_u32(out, static_cast<uint32_t>(chunk.size()));
        util::put_u32(out, static_cast<uint32_t>(packed.size()));
        out += packed;
    }
    return out;
}

std::string decode_blocks(const std::string& blob, std::size_t max_block_bytes,
                          std::size_t expected_bytes) {
    if (blob.size() < 4) {
        throw StorageIntegrityError("Block section too short");
    }
    uint32_t count = util::get_u32(blob.data());
    std::size_t pos = 4;
    std::string raw;
    for (uint32_t i = 0; i < count; ++i) {
        if (pos + 8 > blob.size()) {
            throw StorageIntegrityError("Block header " + std::to_string(i) + " out of bounds");
        }
        uint32_t raw_len = util::get_u32(blob.data() + pos);
        uint32_t comp_len = util::get_u32(blob.data() + pos + 4);
        pos += 8;
        if (comp_len > blob.size() - pos) {
            throw StorageIntegrityError("Block " + std::to_string(i) + " out of bounds");
        }
        if (raw_len > max_block_bytes || raw_len > expected_bytes - raw.size()) {
            throw StorageIntegrityError("Block " + std::to_string(i) + " claims " +
                                        std::to_string(raw_len) + " bytes, expected at most " +
                                        std::to_string(std::min(max_block_bytes, expected_bytes - raw.size())));
        }
        raw += decompress(blob.substr(pos, comp_len), raw_len);
        pos += comp_len;
    }
    if (pos != blob.size()) {
        throw StorageIntegrityError("Trailing bytes after last block");
    }
    return raw;
}

std::string sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

} // namespace codec
