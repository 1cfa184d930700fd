// Framing and checksums for DATA, control, handshake and stats messages
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "us_common.hpp"

const char* decode_error_name(DecodeError e);

// MD5 of data rendered as 32 lowercase hex characters.
std::string digest_hex(const uint8_t* data, size_t len);

void put_u64(uint8_t* out, uint64_t v);
uint64_t get_u64(const uint8_t* in);

// [index:8][length:8][checksum:32][payload]
std::vector<uint8_t> encode_data(uint64_t index, const uint8_t* payload, size_t len);
inline std::vector<uint8_t> encode_data(uint64_t index, const std::vector<uint8_t>& payload) {
    return encode_data(index, payload.data(), payload.size());
}
DecodeError decode_data(const uint8_t* buf, size_t len, DataPacket& out);

// All-zero packet of full wire size marking end of stream.
std::vector<uint8_t> encode_sentinel(uint32_t packet_capacity);
bool is_sentinel(const uint8_t* buf, size_t len);

// [index:8]["ACK" | "NACK"]
std::vector<uint8_t> encode_control(uint64_t index, ControlStatus status);
DecodeError decode_control(const uint8_t* buf, size_t len, ControlPacket& out);

// [file_size:8][file_name utf-8]
std::vector<uint8_t> encode_offer(const FileOffer& offer);
DecodeError decode_offer(const uint8_t* buf, size_t len, FileOffer& out);

// [bytes_accepted:8][packets_lost:8]
std::vector<uint8_t> encode_stats(const TransferStatsMsg& stats);
DecodeError decode_stats(const uint8_t* buf, size_t len, TransferStatsMsg& out);
