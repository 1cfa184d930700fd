#include "us_codec.hpp"

#include <openssl/evp.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>

static constexpr size_t MD5_BYTES = 16;

const char* decode_error_name(DecodeError e) {
    switch (e) {
    case DecodeError::None: return "ok";
    case DecodeError::MalformedPacket: return "malformed packet";
    case DecodeError::ChecksumMismatch: return "checksum mismatch";
    case DecodeError::LengthMismatch: return "length mismatch";
    case DecodeError::UnknownStatus: return "unknown status";
    }
    return "unknown";
}

std::string digest_hex(const uint8_t* data, size_t len) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &md_len) != 1 || md_len != MD5_BYTES) {
        throw std::runtime_error("md5 digest failed");
    }

    char hex[CHECKSUM_BYTES + 1];
    for (size_t i = 0; i < MD5_BYTES; ++i) snprintf(hex + i * 2, 3, "%02x", hash[i]);
    return std::string(hex, CHECKSUM_BYTES);
}

void put_u64(uint8_t* out, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(v & 0xff);
        v >>= 8;
    }
}

uint64_t get_u64(const uint8_t* in) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | in[i];
    return v;
}

std::vector<uint8_t> encode_data(uint64_t index, const uint8_t* payload, size_t len) {
    std::vector<uint8_t> pkt(DATA_HEADER_BYTES + len);
    put_u64(pkt.data(), index);
    put_u64(pkt.data() + INDEX_BYTES, len);
    std::string sum = digest_hex(payload, len);
    std::memcpy(pkt.data() + INDEX_BYTES + LENGTH_BYTES, sum.data(), CHECKSUM_BYTES);
    if (len > 0) std::memcpy(pkt.data() + DATA_HEADER_BYTES, payload, len);
    return pkt;
}

DecodeError decode_data(const uint8_t* buf, size_t len, DataPacket& out) {
    if (len < DATA_HEADER_BYTES) return DecodeError::MalformedPacket;

    out.index = get_u64(buf);
    out.length = get_u64(buf + INDEX_BYTES);
    std::memcpy(out.checksum, buf + INDEX_BYTES + LENGTH_BYTES, CHECKSUM_BYTES);

    size_t available = len - DATA_HEADER_BYTES;
    if (out.length != available) return DecodeError::LengthMismatch;

    const uint8_t* body = buf + DATA_HEADER_BYTES;
    std::string sum = digest_hex(body, available);
    if (std::memcmp(sum.data(), out.checksum, CHECKSUM_BYTES) != 0) return DecodeError::ChecksumMismatch;

    out.payload.assign(body, body + available);
    return DecodeError::None;
}

std::vector<uint8_t> encode_sentinel(uint32_t packet_capacity) {
    return std::vector<uint8_t>(DATA_HEADER_BYTES + packet_capacity, 0);
}

bool is_sentinel(const uint8_t* buf, size_t len) {
    if (len < DATA_HEADER_BYTES) return false;
    for (size_t i = 0; i < len; ++i) {
        if (buf[i] != 0) return false;
    }
    return true;
}

std::vector<uint8_t> encode_control(uint64_t index, ControlStatus status) {
    const char* text = status == ControlStatus::Ack ? "ACK" : "NACK";
    size_t tlen = std::strlen(text);
    std::vector<uint8_t> pkt(INDEX_BYTES + tlen);
    put_u64(pkt.data(), index);
    std::memcpy(pkt.data() + INDEX_BYTES, text, tlen);
    return pkt;
}

DecodeError decode_control(const uint8_t* buf, size_t len, ControlPacket& out) {
    if (len < INDEX_BYTES + 3) return DecodeError::MalformedPacket;
    const char* text = reinterpret_cast<const char*>(buf + INDEX_BYTES);
    size_t tlen = len - INDEX_BYTES;
    if (tlen == 3 && std::memcmp(text, "ACK", 3) == 0) {
        out.status = ControlStatus::Ack;
    } else if (tlen == 4 && std::memcmp(text, "NACK", 4) == 0) {
        out.status = ControlStatus::Nack;
    } else {
        return DecodeError::UnknownStatus;
    }
    out.index = get_u64(buf);
    return DecodeError::None;
}

std::vector<uint8_t> encode_offer(const FileOffer& offer) {
    std::vector<uint8_t> pkt(8 + offer.file_name.size());
    put_u64(pkt.data(), offer.file_size);
    std::memcpy(pkt.data() + 8, offer.file_name.data(), offer.file_name.size());
    return pkt;
}

DecodeError decode_offer(const uint8_t* buf, size_t len, FileOffer& out) {
    if (len < 8) return DecodeError::MalformedPacket;
    out.file_size = get_u64(buf);
    out.file_name.assign(reinterpret_cast<const char*>(buf + 8), len - 8);
    return DecodeError::None;
}

std::vector<uint8_t> encode_stats(const TransferStatsMsg& stats) {
    std::vector<uint8_t> pkt(STATS_BYTES);
    put_u64(pkt.data(), stats.bytes_accepted);
    put_u64(pkt.data() + 8, stats.packets_lost);
    return pkt;
}

DecodeError decode_stats(const uint8_t* buf, size_t len, TransferStatsMsg& out) {
    if (len != STATS_BYTES) return DecodeError::MalformedPacket;
    out.bytes_accepted = get_u64(buf);
    out.packets_lost = get_u64(buf + 8);
    return DecodeError::None;
}
