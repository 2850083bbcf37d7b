/**
 * @file wire.hpp
 * @brief Wire envelope and its binary codec - the bytes two DTChat peers agree on.
 *
 * @details
 * PURPOSE
 * -------
 * Every frame a peer puts on a transport is one envelope: who sent it, for which
 * room, when, from which endpoint the sender can be reached, and exactly one
 * payload (Text, File or Ack). This header defines that envelope and the pure,
 * stateless functions that turn it into bytes and back.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - **message.hpp**: builds envelopes from ChatMessage (`to_envelope`,
 *   `make_ack_envelope`) and ChatMessage from envelopes (`new_received`).
 * - **engine.hpp**: encodes before `send_async`, decodes every received frame.
 * - **transport/slip.hpp**: frames the encoded bytes on stream transports. The
 *   codec never worries about framing.
 *
 * LAYOUT
 * ------
 *   [0] 'D' (0x44) magic
 *   [1] version (0x01)
 *   [2] payload kind (TEXT=0x01, FILE=0x02, ACK=0x03)
 *   [3] reserved (0)
 *   then TLVs: [tag u8][len u32 little-endian][value bytes]
 *
 * Common tags (always present):
 *   TAG_UUID, TAG_SENDER, TAG_ROOM       (utf-8 strings)
 *   TAG_TIMESTAMP                        (i64 little-endian, epoch ms)
 *   TAG_SOURCE_ENDPOINT                  ("<kind> <address>")
 * Payload tags (exactly the set that matches the kind byte):
 *   TEXT: TAG_TEXT
 *   FILE: TAG_FILE_NAME, TAG_FILE_DATA
 *   ACK:  TAG_ACK_UUID
 *
 * Encoding writes tags in the fixed order above, so it is deterministic.
 * Decoding fails closed: short frames, bad magic/version, unknown kind,
 * duplicate tags, payload tags that do not match the kind, and missing fields
 * are all reported. Unknown tags are skipped so later versions can add fields.
 * No semantic validation (empty text, parseable endpoint) happens here.
 *
 * EXAMPLE FLOW
 * ------------
 *   Envelope env = to_envelope(msg);
 *   std::vector<uint8_t> bytes; std::string err;
 *   if (!wire::encode(env, bytes, err)) { ... ProtocolEncode ... }
 *   ...
 *   wire::Envelope in;
 *   if (wire::decode(bytes, in, err) != wire::DecodeStatus::Ok) { ... ProtocolDecode ... }
 *
 * MAINTENANCE
 * -----------
 * Tags are part of the wire contract. Add new ones, never renumber.
 */
#ifndef DTCHAT_WIRE_HPP
#define DTCHAT_WIRE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dtchat {
namespace wire {

constexpr uint8_t MAGIC   = 0x44;  ///< 'D'
constexpr uint8_t VERSION = 0x01;
constexpr size_t  HEADER_LEN = 4;
constexpr size_t  TLV_HEAD_LEN = 5;  ///< tag + u32 length

/// Payload discriminator carried in header byte [2].
enum class PayloadKind : uint8_t {
  Text = 0x01,
  File = 0x02,
  Ack  = 0x03,
};

// ============================== TLV Tags =============================
enum : uint8_t {
  TAG_UUID            = 0x01,  /**< message uuid (string) */
  TAG_SENDER          = 0x02,  /**< sender peer uuid (string) */
  TAG_ROOM            = 0x03,  /**< room uuid (string) */
  TAG_TIMESTAMP       = 0x04,  /**< i64 epoch milliseconds */
  TAG_SOURCE_ENDPOINT = 0x05,  /**< sender's "<kind> <address>" */

  TAG_TEXT            = 0x10,  /**< TEXT payload body */
  TAG_FILE_NAME       = 0x11,  /**< FILE payload name */
  TAG_FILE_DATA       = 0x12,  /**< FILE payload bytes */
  TAG_ACK_UUID        = 0x13,  /**< ACK: uuid of the acknowledged message */
};

enum class DecodeStatus : uint8_t {
  Ok = 0,
  Truncated,        ///< frame shorter than a header or a declared TLV
  BadMagic,
  BadVersion,
  UnknownPayload,   ///< kind byte is not TEXT/FILE/ACK
  DuplicateField,
  MissingField,
  Malformed,        ///< wrong-sized timestamp, payload tag of another kind
};

/// Short lowercase name, e.g. "truncated".
const char* decode_status_name(DecodeStatus s);

/**
 * @brief One wire message. Only the payload fields selected by `kind` are meaningful.
 */
struct Envelope {
  std::string uuid;
  std::string sender_uuid;
  std::string room_uuid;
  int64_t     timestamp_ms{0};
  std::string source_endpoint;

  PayloadKind kind{PayloadKind::Text};
  std::string text;                    ///< Text
  std::string file_name;               ///< File
  std::vector<uint8_t> file_data;      ///< File
  std::string ack_message_uuid;        ///< Ack

  bool operator==(const Envelope& o) const;
  bool operator!=(const Envelope& o) const { return !(*this == o); }
};

/**
 * @brief Serialize an envelope.
 * @param env  envelope to encode
 * @param out  cleared, then filled with the frame bytes
 * @param err  reason on failure
 * @retval false unknown kind or a field longer than 4 GiB
 */
bool encode(const Envelope& env, std::vector<uint8_t>& out, std::string& err);

/**
 * @brief Parse one frame into @p out.
 * @return DecodeStatus::Ok on success; otherwise @p err names the problem and
 *         @p out is unspecified.
 */
DecodeStatus decode(const uint8_t* data, size_t len, Envelope& out, std::string& err);
DecodeStatus decode(const std::vector<uint8_t>& frame, Envelope& out, std::string& err);

/**
 * @brief One-line key=value summary for logs, e.g.
 *   "kind=text uuid=1a2b3c4d sender=9f8e7d6c room=default ts=1700000000000 bytes=5"
 */
std::string describe(const Envelope& env);

} // namespace wire
} // namespace dtchat

#endif // DTCHAT_WIRE_HPP
