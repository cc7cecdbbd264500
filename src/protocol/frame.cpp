#include "frame.hpp"
#include "votelink/logging.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>

namespace votelink {
namespace protocol {
namespace wire {

namespace {

void putU32(uint8_t* dst, uint32_t value) {
    dst[0] = (value >> 24) & 0xFF;
    dst[1] = (value >> 16) & 0xFF;
    dst[2] = (value >> 8) & 0xFF;
    dst[3] = value & 0xFF;
}

uint32_t getU32(const uint8_t* src) {
    return (static_cast<uint32_t>(src[0]) << 24) |
           (static_cast<uint32_t>(src[1]) << 16) |
           (static_cast<uint32_t>(src[2]) << 8) |
           static_cast<uint32_t>(src[3]);
}

bool isKnownKind(uint8_t raw) {
    switch (static_cast<MessageKind>(raw)) {
        case MessageKind::PROMPT:
        case MessageKind::VOTE:
        case MessageKind::ACK:
        case MessageKind::CLOSE:
        case MessageKind::RESET:
            return true;
        default:
            return false;
    }
}

} // namespace

const char* messageKindToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::PROMPT:  return "PROMPT";
        case MessageKind::VOTE:    return "VOTE";
        case MessageKind::ACK:     return "ACK";
        case MessageKind::CLOSE:   return "CLOSE";
        case MessageKind::RESET:   return "RESET";
        case MessageKind::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

const char* codecErrorToString(CodecError err) {
    switch (err) {
        case CodecError::None:      return "None";
        case CodecError::Oversize:  return "Oversize frame";
        case CodecError::Malformed: return "Malformed frame";
        default: return "Unknown error";
    }
}

// ============================================================================
// Message factories
// ============================================================================

Message Message::makePrompt(RoundId round_id, ByteSpan ballot_payload) {
    Message m;
    m.kind = MessageKind::PROMPT;
    m.raw_kind = static_cast<uint8_t>(MessageKind::PROMPT);
    m.round_id = round_id;
    m.ballot_len = static_cast<uint16_t>(std::min<size_t>(ballot_payload.size(), 0xFFFF));
    size_t copy = std::min(ballot_payload.size(), MAX_BALLOT_SIZE);
    if (copy > 0) {
        std::memcpy(m.ballot.data(), ballot_payload.data(), copy);
    }
    return m;
}

Message Message::makeVote(RoundId round_id, Sequence seq, Choice choice) {
    Message m;
    m.kind = MessageKind::VOTE;
    m.raw_kind = static_cast<uint8_t>(MessageKind::VOTE);
    m.round_id = round_id;
    m.sequence = seq;
    m.choice = choice;
    return m;
}

Message Message::makeAck(RoundId round_id, Sequence seq) {
    Message m;
    m.kind = MessageKind::ACK;
    m.raw_kind = static_cast<uint8_t>(MessageKind::ACK);
    m.round_id = round_id;
    m.sequence = seq;
    return m;
}

Message Message::makeClose(RoundId round_id) {
    Message m;
    m.kind = MessageKind::CLOSE;
    m.raw_kind = static_cast<uint8_t>(MessageKind::CLOSE);
    m.round_id = round_id;
    return m;
}

Message Message::makeReset(RoundId round_id) {
    Message m;
    m.kind = MessageKind::RESET;
    m.raw_kind = static_cast<uint8_t>(MessageKind::RESET);
    m.round_id = round_id;
    return m;
}

ByteSpan Message::ballotView() const {
    return ByteSpan(ballot.data(), std::min<size_t>(ballot_len, MAX_BALLOT_SIZE));
}

size_t Message::encodedSize() const {
    switch (kind) {
        case MessageKind::PROMPT: return PROMPT_OVERHEAD + ballot_len;
        case MessageKind::VOTE:   return VOTE_SIZE;
        case MessageKind::ACK:    return ACK_SIZE;
        case MessageKind::CLOSE:  return CLOSE_SIZE;
        case MessageKind::RESET:  return RESET_SIZE;
        default: return 0;
    }
}

bool Message::operator==(const Message& other) const {
    if (kind != other.kind || raw_kind != other.raw_kind || round_id != other.round_id) {
        return false;
    }
    switch (kind) {
        case MessageKind::VOTE:
            return sequence == other.sequence && choice == other.choice;
        case MessageKind::ACK:
            return sequence == other.sequence;
        case MessageKind::PROMPT: {
            if (ballot_len != other.ballot_len) return false;
            ByteSpan a = ballotView();
            ByteSpan b = other.ballotView();
            return std::equal(a.begin(), a.end(), b.begin(), b.end());
        }
        default:
            return true;
    }
}

// ============================================================================
// Encode
// ============================================================================

CodecError encodeInto(const Message& msg, size_t max_frame_size,
                      MutableByteSpan out, size_t& written) {
    written = 0;

    if (msg.kind == MessageKind::UNKNOWN) {
        // Nothing sensible to put on the wire
        return CodecError::Malformed;
    }
    if (msg.kind == MessageKind::PROMPT && msg.ballot_len > MAX_BALLOT_SIZE) {
        return CodecError::Oversize;
    }

    size_t size = msg.encodedSize();
    if (size > max_frame_size || size > out.size()) {
        return CodecError::Oversize;
    }

    uint8_t* p = out.data();

    // Header: kind (1) + round id (4, big-endian)
    p[0] = static_cast<uint8_t>(msg.kind);
    putU32(p + 1, msg.round_id);

    switch (msg.kind) {
        case MessageKind::PROMPT:
            p[5] = static_cast<uint8_t>(msg.ballot_len);
            if (msg.ballot_len > 0) {
                std::memcpy(p + PROMPT_OVERHEAD, msg.ballot.data(), msg.ballot_len);
            }
            break;
        case MessageKind::VOTE:
            putU32(p + 5, msg.sequence);
            p[9] = msg.choice;
            break;
        case MessageKind::ACK:
            putU32(p + 5, msg.sequence);
            break;
        default:
            break;
    }

    written = size;
    return CodecError::None;
}

CodecError encode(const Message& msg, size_t max_frame_size, Bytes& out) {
    out.clear();
    std::array<uint8_t, PROMPT_OVERHEAD + MAX_BALLOT_SIZE> buf;
    size_t written = 0;
    CodecError err = encodeInto(msg, max_frame_size, MutableByteSpan(buf.data(), buf.size()), written);
    if (err != CodecError::None) {
        LOG_PROTO(DEBUG, "Codec: encode %s failed: %s (size=%zu, mtu=%zu)",
                  messageKindToString(msg.kind), codecErrorToString(err),
                  msg.encodedSize(), max_frame_size);
        return err;
    }
    out.assign(buf.begin(), buf.begin() + written);
    return CodecError::None;
}

// ============================================================================
// Decode
// ============================================================================

CodecError decode(ByteSpan frame, Message& out) {
    out = Message{};

    if (frame.size() < HEADER_SIZE) {
        return CodecError::Malformed;
    }

    const uint8_t* p = frame.data();
    out.raw_kind = p[0];
    out.round_id = getU32(p + 1);

    if (!isKnownKind(p[0])) {
        out.kind = MessageKind::UNKNOWN;
        return CodecError::None;
    }

    MessageKind kind = static_cast<MessageKind>(p[0]);
    switch (kind) {
        case MessageKind::PROMPT: {
            if (frame.size() < PROMPT_OVERHEAD) {
                return CodecError::Malformed;
            }
            uint8_t len = p[5];
            if (frame.size() != PROMPT_OVERHEAD + len) {
                return CodecError::Malformed;
            }
            out.ballot_len = len;
            if (len > 0) {
                std::memcpy(out.ballot.data(), p + PROMPT_OVERHEAD, len);
            }
            break;
        }
        case MessageKind::VOTE:
            if (frame.size() != VOTE_SIZE) {
                return CodecError::Malformed;
            }
            out.sequence = getU32(p + 5);
            out.choice = p[9];
            break;
        case MessageKind::ACK:
            if (frame.size() != ACK_SIZE) {
                return CodecError::Malformed;
            }
            out.sequence = getU32(p + 5);
            break;
        case MessageKind::CLOSE:
        case MessageKind::RESET:
            if (frame.size() != HEADER_SIZE) {
                return CodecError::Malformed;
            }
            break;
        default:
            break;
    }

    out.kind = kind;
    return CodecError::None;
}

std::string describe(const Message& msg) {
    char buf[96];
    switch (msg.kind) {
        case MessageKind::PROMPT:
            snprintf(buf, sizeof(buf), "PROMPT round=%u ballot=%u bytes",
                     msg.round_id, static_cast<unsigned>(msg.ballot_len));
            break;
        case MessageKind::VOTE:
            snprintf(buf, sizeof(buf), "VOTE round=%u seq=%u choice=%u",
                     msg.round_id, msg.sequence, static_cast<unsigned>(msg.choice));
            break;
        case MessageKind::ACK:
            snprintf(buf, sizeof(buf), "ACK round=%u seq=%u", msg.round_id, msg.sequence);
            break;
        case MessageKind::CLOSE:
        case MessageKind::RESET:
            snprintf(buf, sizeof(buf), "%s round=%u", messageKindToString(msg.kind), msg.round_id);
            break;
        default:
            snprintf(buf, sizeof(buf), "UNKNOWN kind=0x%02X round=%u",
                     static_cast<unsigned>(msg.raw_kind), msg.round_id);
            break;
    }
    return buf;
}

} // namespace wire
} // namespace protocol
} // namespace votelink
