#include "aes67_command.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstring>
#include <map>
#include <utility>

#include "../dante_constants.h"

namespace dantebridge {
namespace engine {

namespace {

constexpr uint8_t kEncodingL16 = 0x06;
constexpr uint8_t kEncodingL24 = 0x08;
constexpr uint8_t kEncodingL32 = 0x0A;

const std::map<std::string, uint8_t> kEncodingBytes = {
    {"L16", kEncodingL16},
    {"L24", kEncodingL24},
    {"L32", kEncodingL32},
};

inline void put_u16(std::vector<uint8_t>& buf, std::size_t offset, uint16_t value) {
    buf[offset] = static_cast<uint8_t>(value >> 8);
    buf[offset + 1] = static_cast<uint8_t>(value & 0xFF);
}

inline void put_u32(std::vector<uint8_t>& buf, std::size_t offset, uint32_t value) {
    buf[offset] = static_cast<uint8_t>(value >> 24);
    buf[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buf[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buf[offset + 3] = static_cast<uint8_t>(value & 0xFF);
}

bool put_ipv4(std::vector<uint8_t>& buf, std::size_t offset, const std::string& address) {
    struct in_addr addr;
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return false;
    }
    // s_addr is already in network order.
    std::memcpy(buf.data() + offset, &addr.s_addr, 4);
    return true;
}

} // namespace

const char* to_string(Aes67Outcome outcome) {
    switch (outcome) {
        case Aes67Outcome::Success: return "success";
        case Aes67Outcome::Rejected: return "rejected";
        case Aes67Outcome::MalformedResponse: return "malformed response";
        case Aes67Outcome::Timeout: return "timeout";
        case Aes67Outcome::SocketError: return "socket error";
    }
    return "unknown";
}

uint8_t encoding_byte_for_codec(const std::string& codec) {
    const std::string name = codec.empty() ? std::string("L24") : codec.substr(0, codec.find('/'));
    auto it = kEncodingBytes.find(name);
    return it != kEncodingBytes.end() ? it->second : kEncodingL24;
}

bool encode_subscribe(uint16_t rx_channel,
                      uint8_t flow_channel,
                      const StreamInfo& stream,
                      uint16_t sequence,
                      std::vector<uint8_t>& out,
                      std::string& error) {
    if (!stream.port) {
        error = "stream '" + stream.session_name + "' has no RTP port";
        return false;
    }
    if (*stream.port < kMinRtpPort || *stream.port > kMaxRtpPort) {
        error = "stream '" + stream.session_name + "' has out-of-range RTP port " +
                std::to_string(*stream.port);
        return false;
    }
    if (stream.channel_count < 1 || stream.channel_count > kMaxStreamChannels) {
        error = "stream '" + stream.session_name + "' has unsupported channel count " +
                std::to_string(stream.channel_count);
        return false;
    }

    std::vector<uint8_t> frame(kAes67CommandSize, 0);

    // Header
    frame[0] = 0x28;
    frame[1] = 0x09;
    put_u16(frame, 2, static_cast<uint16_t>(kAes67CommandSize));
    put_u16(frame, 4, sequence);
    frame[6] = 0x32;
    frame[7] = 0x01;

    frame[10] = 0x01;
    frame[11] = 0x01;
    frame[12] = 0x00;
    frame[13] = 0x10;

    put_u16(frame, 18, 0x4202); // record type
    put_u16(frame, 28, 0x0001); // record count
    put_u16(frame, 34, 0x0068); // content offset
    put_u16(frame, 44, 0x0003);
    put_u16(frame, 46, 0x0040);
    put_u16(frame, 52, 0x0002);
    put_u16(frame, 54, 0x0060);

    // Flow source
    put_u16(frame, 64, 0x1000);
    put_u16(frame, 66, 0x000B);
    if (!stream.origin_ip.empty() && !put_ipv4(frame, 68, stream.origin_ip)) {
        error = "invalid origin address '" + stream.origin_ip + "'";
        return false;
    }
    put_u32(frame, 76, static_cast<uint32_t>(stream.session_id.value_or(0) & 0xFFFFFFFFULL));

    // Channel mapping
    const uint16_t channel_count = static_cast<uint16_t>(stream.channel_count);
    put_u16(frame, 96, rx_channel);
    put_u16(frame, 98, channel_count);
    frame[102] = flow_channel;
    frame[104] = encoding_byte_for_codec(stream.codec);
    frame[105] = static_cast<uint8_t>(channel_count);
    put_u16(frame, 106, static_cast<uint16_t>(*stream.port));
    if (!put_ipv4(frame, 108, stream.multicast_addr)) {
        error = "invalid multicast address '" + stream.multicast_addr + "'";
        return false;
    }

    out = std::move(frame);
    return true;
}

Aes67SubscribeResult decode_subscribe_response(const uint8_t* data, std::size_t size) {
    Aes67SubscribeResult result;
    if (data == nullptr || size < kAes67MinResponseSize || data[0] != 0x28 || data[1] != 0x01) {
        result.outcome = Aes67Outcome::MalformedResponse;
        result.detail = "unexpected response (" + std::to_string(size) + " bytes)";
        return result;
    }

    const uint16_t status = static_cast<uint16_t>((data[8] << 8) | data[9]);
    result.status = status;
    if (status == kAes67StatusSuccess) {
        result.outcome = Aes67Outcome::Success;
    } else {
        result.outcome = Aes67Outcome::Rejected;
        result.detail = "device returned status " + std::to_string(status);
    }
    return result;
}

} // namespace engine
} // namespace dantebridge
