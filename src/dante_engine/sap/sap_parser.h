#ifndef DANTEBRIDGE_SAP_PARSER_H
#define DANTEBRIDGE_SAP_PARSER_H

#include <string>
#include <vector>

#include "sap_types.h"

namespace dantebridge {
namespace engine {

/**
 * @brief Decodes one SAP datagram into a StreamInfo.
 * @return false for deletions, non-v1 packets, truncated headers, a missing MIME
 *         terminator or an SDP body without an `s=` line.
 */
bool parse_sap_packet(const char* buffer,
                      int size,
                      const std::string& logger_prefix,
                      StreamInfo& out);

/**
 * @brief Parses SDP text. Unknown or malformed lines are skipped.
 * @return false only when no non-empty `s=` line is present.
 */
bool parse_sdp(const std::string& sdp_text,
               const std::string& logger_prefix,
               StreamInfo& out);

/**
 * @brief Ordered channel labels for a stream.
 * @details Uses the names listed after the first ':' of the `i=` line when their count
 *          matches the channel count, otherwise Mono / Left,Right / Ch1..ChN.
 *          Empty when the channel count is outside 1..255.
 */
std::vector<std::string> derive_channel_names(const StreamInfo& stream);

/** @brief Replaces invalid UTF-8 sequences with U+FFFD. */
std::string decode_utf8_lossy(const char* data, std::size_t size);

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_SAP_PARSER_H
