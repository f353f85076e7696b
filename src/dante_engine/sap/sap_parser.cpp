#include "sap_parser.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <utility>

#include "../dante_constants.h"
#include "../utils/cpp_logger.h"

namespace dantebridge {
namespace engine {

namespace {

constexpr uint8_t kSapVersion = 1;
constexpr int kSapFixedHeaderLen = 4;
constexpr int kIpv4OriginLen = 4;
constexpr int kIpv6OriginLen = 16;

std::string trim_copy(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

bool parse_int_strict(const std::string& value, long long& out) {
    const std::string trimmed = trim_copy(value);
    if (trimmed.empty()) {
        return false;
    }
    char* end_ptr = nullptr;
    errno = 0;
    const long long parsed = std::strtoll(trimmed.c_str(), &end_ptr, 10);
    if (end_ptr == trimmed.c_str() || *end_ptr != '\0' || errno == ERANGE) {
        return false;
    }
    out = parsed;
    return true;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> split_sdp_lines(const std::string& payload) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : payload) {
        if (c == '\n' || c == '\r') {
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

bool extract_sdp_payload(const char* buffer, int size, const std::string& logger_prefix, const char*& sdp_start, int& sdp_size) {
    if (!buffer || size < kSapFixedHeaderLen) {
        LOG_CPP_DEBUG("%s SAP packet too small for header: %d bytes", logger_prefix.c_str(), size);
        return false;
    }

    const uint8_t first_byte = static_cast<uint8_t>(buffer[0]);
    const uint8_t version = (first_byte >> 5) & 0x07u;
    const bool ipv6_origin = ((first_byte >> 4) & 0x01u) != 0;
    const bool is_deletion = ((first_byte >> 2) & 0x01u) != 0;

    if (version != kSapVersion) {
        LOG_CPP_DEBUG("%s Ignoring SAP packet with version %u", logger_prefix.c_str(), version);
        return false;
    }
    if (is_deletion) {
        LOG_CPP_DEBUG("%s Ignoring SAP deletion packet", logger_prefix.c_str());
        return false;
    }

    const int auth_len = static_cast<uint8_t>(buffer[1]) * 4;
    const int origin_len = ipv6_origin ? kIpv6OriginLen : kIpv4OriginLen;
    const int payload_offset = kSapFixedHeaderLen + origin_len + auth_len;
    if (payload_offset >= size) {
        LOG_CPP_DEBUG("%s Invalid SAP packet, no SDP data found", logger_prefix.c_str());
        return false;
    }

    const char* payload = buffer + payload_offset;
    int payload_size = size - payload_offset;

    // An optional null-terminated MIME type may precede the SDP body.
    if (!(payload_size >= 2 && payload[0] == 'v' && payload[1] == '=')) {
        const void* terminator = std::memchr(payload, '\0', static_cast<std::size_t>(payload_size));
        if (!terminator) {
            LOG_CPP_DEBUG("%s SAP payload has neither SDP nor a MIME terminator", logger_prefix.c_str());
            return false;
        }
        const int skip = static_cast<int>(static_cast<const char*>(terminator) - payload) + 1;
        payload += skip;
        payload_size -= skip;
    }

    sdp_start = payload;
    sdp_size = payload_size;
    return true;
}

void parse_origin_line(const std::string& body, StreamInfo& out, const std::string& logger_prefix) {
    const auto parts = split_whitespace(body);
    if (parts.size() < 6) {
        LOG_CPP_DEBUG("%s Skipping short o-line: %s", logger_prefix.c_str(), body.c_str());
        return;
    }
    out.origin_ip = parts[5];
    long long session_id = 0;
    if (parse_int_strict(parts[1], session_id) && session_id >= 0) {
        out.session_id = static_cast<uint64_t>(session_id);
    } else {
        LOG_CPP_DEBUG("%s Failed to parse session id from o-line: %s", logger_prefix.c_str(), body.c_str());
    }
}

void parse_connection_line(const std::string& body, StreamInfo& out) {
    const auto parts = split_whitespace(body);
    if (parts.size() < 3) {
        return;
    }
    const std::string& address = parts[2];
    out.multicast_addr = address.substr(0, address.find('/'));
}

void parse_media_line(const std::string& body, StreamInfo& out) {
    const auto parts = split_whitespace(body);
    if (parts.size() < 2) {
        return;
    }
    long long port = 0;
    if (parse_int_strict(parts[1], port) && port >= kMinRtpPort && port <= kMaxRtpPort) {
        out.port = static_cast<int>(port);
    }
}

void parse_rtpmap_line(const std::string& line, StreamInfo& out) {
    const auto space_pos = line.find(' ');
    if (space_pos == std::string::npos) {
        return;
    }
    out.codec = line.substr(space_pos + 1);

    std::vector<std::string> codec_parts;
    std::stringstream ss(out.codec);
    std::string part;
    while (std::getline(ss, part, '/')) {
        codec_parts.push_back(part);
    }
    long long channels = 0;
    if (codec_parts.size() >= 3 && parse_int_strict(codec_parts[2], channels) &&
        channels >= 1 && channels <= kMaxStreamChannels) {
        out.channel_count = static_cast<int>(channels);
    }
}

} // namespace

std::string decode_utf8_lossy(const char* data, std::size_t size) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(size);
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    std::size_t i = 0;
    while (i < size) {
        const unsigned char lead = bytes[i];
        std::size_t length = 0;
        uint32_t min_value = 0;
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            min_value = 0x10000;
        } else {
            out.append(kReplacement);
            ++i;
            continue;
        }

        uint32_t code_point = lead & (0xFF >> (length + 1));
        std::size_t consumed = 1;
        bool valid = true;
        while (consumed < length) {
            if (i + consumed >= size || (bytes[i + consumed] & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code_point = (code_point << 6) | (bytes[i + consumed] & 0x3F);
            ++consumed;
        }
        if (valid && (code_point < min_value || code_point > 0x10FFFF ||
                      (code_point >= 0xD800 && code_point <= 0xDFFF))) {
            valid = false;
        }
        if (valid) {
            out.append(reinterpret_cast<const char*>(bytes + i), length);
            i += length;
        } else {
            out.append(kReplacement);
            i += consumed;
        }
    }
    return out;
}

bool parse_sdp(const std::string& sdp_text, const std::string& logger_prefix, StreamInfo& out) {
    StreamInfo info;

    for (const auto& raw_line : split_sdp_lines(sdp_text)) {
        const std::string line = trim_copy(raw_line);
        if (line.rfind("s=", 0) == 0) {
            info.session_name = line.substr(2);
        } else if (line.rfind("o=", 0) == 0) {
            parse_origin_line(line.substr(2), info, logger_prefix);
        } else if (line.rfind("c=", 0) == 0) {
            parse_connection_line(line.substr(2), info);
        } else if (line.rfind("m=", 0) == 0) {
            parse_media_line(line.substr(2), info);
        } else if (line.rfind("a=rtpmap:", 0) == 0) {
            parse_rtpmap_line(line, info);
        } else if (line.rfind("i=", 0) == 0) {
            info.channel_info = line.substr(2);
        }
    }

    if (info.session_name.empty()) {
        LOG_CPP_DEBUG("%s SDP body has no session name", logger_prefix.c_str());
        return false;
    }

    out = std::move(info);
    return true;
}

bool parse_sap_packet(const char* buffer,
                      int size,
                      const std::string& logger_prefix,
                      StreamInfo& out) {
    const char* sdp_start = nullptr;
    int sdp_size = 0;
    if (!extract_sdp_payload(buffer, size, logger_prefix, sdp_start, sdp_size)) {
        return false;
    }

    const std::string sdp_text = decode_utf8_lossy(sdp_start, static_cast<std::size_t>(sdp_size));
    return parse_sdp(sdp_text, logger_prefix, out);
}

std::vector<std::string> derive_channel_names(const StreamInfo& stream) {
    const int channel_count = stream.channel_count;
    if (channel_count < 1 || channel_count > kMaxStreamChannels) {
        return {};
    }

    if (stream.channel_info && !stream.channel_info->empty()) {
        const std::string& info = *stream.channel_info;
        const auto colon = info.find(':');
        if (colon != std::string::npos) {
            std::vector<std::string> names;
            std::stringstream ss(info.substr(colon + 1));
            std::string token;
            while (std::getline(ss, token, ',')) {
                token = trim_copy(token);
                if (!token.empty()) {
                    names.push_back(token);
                }
            }
            if (static_cast<int>(names.size()) == channel_count) {
                return names;
            }
        }
    }

    if (channel_count == 1) {
        return {"Mono"};
    }
    if (channel_count == 2) {
        return {"Left", "Right"};
    }
    std::vector<std::string> generic;
    for (int i = 1; i <= channel_count; ++i) {
        generic.push_back("Ch" + std::to_string(i));
    }
    return generic;
}

} // namespace engine
} // namespace dantebridge
