#pragma once

#include "votelink/types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace votelink {
namespace protocol {
namespace wire {

/**
 * Vote link wire format
 *
 * Every frame starts with a fixed 5-byte header:
 *   [0]    message kind
 *   [1..4] round id (big-endian)
 *
 * followed by a kind-specific fixed body:
 *   PROMPT  length(1) + ballot payload (length bytes)
 *   VOTE    sequence(4, big-endian) + choice(1)
 *   ACK     sequence(4, big-endian)
 *   CLOSE   (empty)
 *   RESET   (empty)
 *
 * A frame must be exactly the length its kind implies. Kinds this build does
 * not know decode to UNKNOWN (header only) so newer controllers cannot crash
 * the coordinator.
 */

enum class MessageKind : uint8_t {
    PROMPT = 0x01,   // Coordinator -> controller: ballot for round
    VOTE = 0x02,     // Controller -> coordinator
    ACK = 0x03,      // Coordinator -> controller: vote accepted
    CLOSE = 0x04,    // Coordinator -> all: round closed
    RESET = 0x05,    // Coordinator -> all: round archived, clear indicators
    UNKNOWN = 0xFF,  // Not a kind this build understands
};

enum class CodecError {
    None,
    Oversize,    // Encoded form exceeds the transport MTU
    Malformed,   // Truncated, trailing bytes, or inconsistent length prefix
};

const char* messageKindToString(MessageKind kind);
const char* codecErrorToString(CodecError err);

constexpr size_t HEADER_SIZE = 5;
constexpr size_t PROMPT_OVERHEAD = HEADER_SIZE + 1;
constexpr size_t VOTE_SIZE = HEADER_SIZE + 5;
constexpr size_t ACK_SIZE = HEADER_SIZE + 4;
constexpr size_t CLOSE_SIZE = HEADER_SIZE;
constexpr size_t RESET_SIZE = HEADER_SIZE;
constexpr size_t MAX_BALLOT_SIZE = 255;   // 1-byte length prefix

// Decoded protocol message. Fixed storage keeps decode allocation-free.
struct Message {
    MessageKind kind = MessageKind::UNKNOWN;
    uint8_t raw_kind = 0xFF;   // Kind byte as seen on the wire
    RoundId round_id = 0;
    Sequence sequence = 0;     // VOTE, ACK
    Choice choice = 0;         // VOTE
    uint16_t ballot_len = 0;   // PROMPT; may exceed MAX_BALLOT_SIZE, encode rejects that
    std::array<uint8_t, MAX_BALLOT_SIZE> ballot{};

    static Message makePrompt(RoundId round_id, ByteSpan ballot_payload);
    static Message makeVote(RoundId round_id, Sequence seq, Choice choice);
    static Message makeAck(RoundId round_id, Sequence seq);
    static Message makeClose(RoundId round_id);
    static Message makeReset(RoundId round_id);

    ByteSpan ballotView() const;

    // Exact encoded size, or 0 for UNKNOWN
    size_t encodedSize() const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

// Serialize into a caller-provided buffer (no allocation).
// Fails with Oversize when the frame would exceed max_frame_size or out.size().
CodecError encodeInto(const Message& msg, size_t max_frame_size,
                      MutableByteSpan out, size_t& written);

// Serialize into a fresh buffer. out is left empty on failure.
CodecError encode(const Message& msg, size_t max_frame_size, Bytes& out);

// Parse a frame. Unknown kinds succeed with kind == UNKNOWN.
CodecError decode(ByteSpan frame, Message& out);

// One-line description for logs
std::string describe(const Message& msg);

} // namespace wire
} // namespace protocol
} // namespace votelink
