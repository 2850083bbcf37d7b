#include "dtchat/wire.hpp"   // envelope, tags, encode/decode API

#include <limits>          // std::numeric_limits for the u32 length guard
#include <sstream>         // std::ostringstream: describe()

#include "dtchat/uuid.hpp" // short_id() in describe()

namespace dtchat {
namespace wire {
// ============================================================================
// Low-level helpers
// ============================================================================
// Building blocks for frames: push a header, push TLVs, read them back.

// ---------------------------------------------------------------------------
// Start a new frame header.
// Layout: [magic][version][kind][reserved]
// ---------------------------------------------------------------------------
static inline void header(std::vector<uint8_t>& b, PayloadKind kind, size_t hint) {
    b.clear();
    b.reserve(HEADER_LEN + hint);
    b.push_back(MAGIC);
    b.push_back(VERSION);
    b.push_back(static_cast<uint8_t>(kind));
    b.push_back(0);                      // reserved
}

static inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));           // low byte first
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

// ---------------------------------------------------------------------------
// Append a raw TLV (tag + u32 length + value bytes).
// All other add_tlv_* helpers feed into this. Returns false if the value does
// not fit a u32 length.
// ---------------------------------------------------------------------------
static inline bool add_tlv_bytes(std::vector<uint8_t>& b,
                                 uint8_t tag,
                                 const uint8_t* p,
                                 size_t len) {
    if (len > std::numeric_limits<uint32_t>::max()) return false;
    b.push_back(tag);
    put_u32(b, static_cast<uint32_t>(len));
    if (len)
        b.insert(b.end(), p, p + len);
    return true;
}

static inline bool add_tlv_str(std::vector<uint8_t>& b, uint8_t tag, const std::string& s) {
    return add_tlv_bytes(b, tag, reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

static inline bool add_tlv_i64(std::vector<uint8_t>& b, uint8_t tag, int64_t v) {
    const uint64_t u = static_cast<uint64_t>(v);
    uint8_t x[8];
    for (int i = 0; i < 8; ++i) x[i] = static_cast<uint8_t>((u >> (8 * i)) & 0xFF);
    return add_tlv_bytes(b, tag, x, 8);
}

static inline uint32_t get_u32(const uint8_t* p) {
    return  static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static inline bool as_i64(const std::string& s, int64_t& out) {
    if (s.size() != 8) return false;
    uint64_t u = 0;
    for (int i = 0; i < 8; ++i)
        u |= static_cast<uint64_t>(static_cast<uint8_t>(s[i])) << (8 * i);
    out = static_cast<int64_t>(u);
    return true;
}

static bool known_kind(uint8_t k) {
    return k == static_cast<uint8_t>(PayloadKind::Text) ||
           k == static_cast<uint8_t>(PayloadKind::File) ||
           k == static_cast<uint8_t>(PayloadKind::Ack);
}

static const char* kind_label(PayloadKind k) {
    switch (k) {
        case PayloadKind::Text: return "text";
        case PayloadKind::File: return "file";
        case PayloadKind::Ack:  return "ack";
    }
    return "unknown";
}

const char* decode_status_name(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::Ok:             return "ok";
        case DecodeStatus::Truncated:      return "truncated";
        case DecodeStatus::BadMagic:       return "bad_magic";
        case DecodeStatus::BadVersion:     return "bad_version";
        case DecodeStatus::UnknownPayload: return "unknown_payload";
        case DecodeStatus::DuplicateField: return "duplicate_field";
        case DecodeStatus::MissingField:   return "missing_field";
        case DecodeStatus::Malformed:      return "malformed";
    }
    return "unknown";
}

bool Envelope::operator==(const Envelope& o) const {
    if (uuid != o.uuid || sender_uuid != o.sender_uuid || room_uuid != o.room_uuid ||
        timestamp_ms != o.timestamp_ms || source_endpoint != o.source_endpoint ||
        kind != o.kind)
        return false;
    switch (kind) {
        case PayloadKind::Text: return text == o.text;
        case PayloadKind::File: return file_name == o.file_name && file_data == o.file_data;
        case PayloadKind::Ack:  return ack_message_uuid == o.ack_message_uuid;
    }
    return false;
}

// ============================================================================
// encode()
// ============================================================================
bool encode(const Envelope& env, std::vector<uint8_t>& out, std::string& err) {
    if (!known_kind(static_cast<uint8_t>(env.kind))) {
        err = "unknown payload kind";
        return false;
    }

    size_t hint = env.uuid.size() + env.sender_uuid.size() + env.room_uuid.size() +
                  env.source_endpoint.size() + 8 + 9 * TLV_HEAD_LEN;
    if (env.kind == PayloadKind::Text) hint += env.text.size();
    if (env.kind == PayloadKind::File) hint += env.file_name.size() + env.file_data.size();
    if (env.kind == PayloadKind::Ack)  hint += env.ack_message_uuid.size();

    header(out, env.kind, hint);

    // Phase: common fields
    bool ok = add_tlv_str(out, TAG_UUID, env.uuid) &&
              add_tlv_str(out, TAG_SENDER, env.sender_uuid) &&
              add_tlv_str(out, TAG_ROOM, env.room_uuid) &&
              add_tlv_i64(out, TAG_TIMESTAMP, env.timestamp_ms) &&
              add_tlv_str(out, TAG_SOURCE_ENDPOINT, env.source_endpoint);

    // Phase: payload
    if (ok) {
        switch (env.kind) {
            case PayloadKind::Text:
                ok = add_tlv_str(out, TAG_TEXT, env.text);
                break;
            case PayloadKind::File:
                ok = add_tlv_str(out, TAG_FILE_NAME, env.file_name) &&
                     add_tlv_bytes(out, TAG_FILE_DATA, env.file_data.data(), env.file_data.size());
                break;
            case PayloadKind::Ack:
                ok = add_tlv_str(out, TAG_ACK_UUID, env.ack_message_uuid);
                break;
        }
    }

    if (!ok) {
        out.clear();
        err = "field exceeds 4 GiB";
        return false;
    }
    return true;
}

// ============================================================================
// decode()
// ---------------------------------------------------------------------------
// Walk the TLV section once, remembering which tags were seen, then check the
// set of tags against the kind byte.
// ============================================================================

// Bit per known tag, for duplicate and presence checks.
static uint32_t tag_bit(uint8_t tag) {
    switch (tag) {
        case TAG_UUID:            return 1u << 0;
        case TAG_SENDER:          return 1u << 1;
        case TAG_ROOM:            return 1u << 2;
        case TAG_TIMESTAMP:       return 1u << 3;
        case TAG_SOURCE_ENDPOINT: return 1u << 4;
        case TAG_TEXT:            return 1u << 5;
        case TAG_FILE_NAME:       return 1u << 6;
        case TAG_FILE_DATA:       return 1u << 7;
        case TAG_ACK_UUID:        return 1u << 8;
        default:                  return 0;
    }
}

static const uint32_t COMMON_BITS = (1u << 0) | (1u << 1) | (1u << 2) | (1u << 3) | (1u << 4);
static const uint32_t TEXT_BITS   = (1u << 5);
static const uint32_t FILE_BITS   = (1u << 6) | (1u << 7);
static const uint32_t ACK_BITS    = (1u << 8);

DecodeStatus decode(const uint8_t* f, size_t n, Envelope& out, std::string& err) {
    if (f == nullptr || n < HEADER_LEN) {
        err = "frame shorter than header";
        return DecodeStatus::Truncated;
    }
    if (f[0] != MAGIC) {
        err = "bad magic";
        return DecodeStatus::BadMagic;
    }
    if (f[1] != VERSION) {
        err = "unsupported version " + std::to_string(unsigned(f[1]));
        return DecodeStatus::BadVersion;
    }
    if (!known_kind(f[2])) {
        err = "unknown payload kind " + std::to_string(unsigned(f[2]));
        return DecodeStatus::UnknownPayload;
    }

    out = Envelope{};
    out.kind = static_cast<PayloadKind>(f[2]);

    uint32_t seen = 0;
    size_t off = HEADER_LEN;
    while (off < n) {
        if (n - off < TLV_HEAD_LEN) {
            err = "truncated tlv header";
            return DecodeStatus::Truncated;
        }
        const uint8_t tag = f[off];
        const uint32_t len = get_u32(f + off + 1);
        off += TLV_HEAD_LEN;
        if (len > n - off) {
            err = "tlv length runs past frame";
            return DecodeStatus::Truncated;
        }

        const uint8_t* v = f + off;
        off += len;

        const uint32_t bit = tag_bit(tag);
        if (bit == 0) continue;                   // unknown tag: skip
        if (seen & bit) {
            err = "duplicate tag " + std::to_string(unsigned(tag));
            return DecodeStatus::DuplicateField;
        }
        seen |= bit;

        const std::string s(reinterpret_cast<const char*>(v), len);
        switch (tag) {
            case TAG_UUID:            out.uuid = s; break;
            case TAG_SENDER:          out.sender_uuid = s; break;
            case TAG_ROOM:            out.room_uuid = s; break;
            case TAG_SOURCE_ENDPOINT: out.source_endpoint = s; break;
            case TAG_TIMESTAMP:
                if (!as_i64(s, out.timestamp_ms)) {
                    err = "timestamp must be 8 bytes";
                    return DecodeStatus::Malformed;
                }
                break;
            case TAG_TEXT:      out.text = s; break;
            case TAG_FILE_NAME: out.file_name = s; break;
            case TAG_FILE_DATA: out.file_data.assign(v, v + len); break;
            case TAG_ACK_UUID:  out.ack_message_uuid = s; break;
            default: break;
        }
    }

    if ((seen & COMMON_BITS) != COMMON_BITS) {
        err = "missing common field";
        return DecodeStatus::MissingField;
    }

    uint32_t want = 0;
    switch (out.kind) {
        case PayloadKind::Text: want = TEXT_BITS; break;
        case PayloadKind::File: want = FILE_BITS; break;
        case PayloadKind::Ack:  want = ACK_BITS;  break;
    }
    const uint32_t payload_seen = seen & ~COMMON_BITS;
    if (payload_seen & ~want) {
        err = std::string("payload field does not belong to kind ") + kind_label(out.kind);
        return DecodeStatus::Malformed;
    }
    if (payload_seen != want) {
        err = std::string("missing ") + kind_label(out.kind) + " payload field";
        return DecodeStatus::MissingField;
    }
    return DecodeStatus::Ok;
}

DecodeStatus decode(const std::vector<uint8_t>& frame, Envelope& out, std::string& err) {
    return decode(frame.data(), frame.size(), out, err);
}

// ============================================================================
// describe()
// ---------------------------------------------------------------------------
// Lossy, grep-friendly summary. Never prints payload bytes.
// ============================================================================
std::string describe(const Envelope& env) {
    std::ostringstream os;
    os << "kind=" << kind_label(env.kind)
       << " uuid=" << short_id(env.uuid)
       << " sender=" << short_id(env.sender_uuid)
       << " room=" << short_id(env.room_uuid)
       << " ts=" << env.timestamp_ms;
    switch (env.kind) {
        case PayloadKind::Text:
            os << " bytes=" << env.text.size();
            break;
        case PayloadKind::File:
            os << " file=" << env.file_name << " bytes=" << env.file_data.size();
            break;
        case PayloadKind::Ack:
            os << " ack=" << short_id(env.ack_message_uuid);
            break;
    }
    return os.str();
}

} // namespace wire
} // namespace dtchat
