// test_frame_codec.cpp - Unit test for the vote link wire format
//
// Tests:
// 1. Every message kind encodes to its fixed layout and decodes back
// 2. Big-endian field layout
// 3. Oversize frames rejected at encode time
// 4. Truncated / padded / inconsistent frames rejected as malformed
// 5. Unknown kinds decode to UNKNOWN instead of failing
// 6. encodeInto() with a caller buffer

#include "protocol/frame.hpp"
#include "votelink/logging.hpp"
#include <iostream>
#include <string>

using namespace votelink;
using namespace votelink::protocol::wire;

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

static Bytes bytesOf(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

int main() {
    std::cout << "=== Frame Codec Unit Test ===\n\n";
    setLogLevel(LogLevel::WARN);

    constexpr size_t MTU = 20;

    // ========================================================================
    // TEST 1: Round trip for every kind
    // ========================================================================
    std::cout << "TEST 1: Round trip for every kind\n";
    {
        Bytes ballot = bytesOf("Lunch?");
        Message msgs[] = {
            Message::makePrompt(7, ballot),
            Message::makePrompt(8, Bytes{}),
            Message::makeVote(7, 3, CHOICE_YES),
            Message::makeVote(0xFFFFFFFF, 0xFFFFFFFF, 0xFF),
            Message::makeAck(7, 3),
            Message::makeClose(7),
            Message::makeReset(7),
        };

        for (const Message& m : msgs) {
            Bytes frame;
            CodecError enc = encode(m, MTU, frame);
            Message out;
            CodecError dec = decode(frame, out);
            check(enc == CodecError::None && dec == CodecError::None && out == m &&
                  frame.size() == m.encodedSize(),
                  std::string("decode(encode(") + describe(m) + ")) matches");
        }
    }

    // ========================================================================
    // TEST 2: Field layout
    // ========================================================================
    std::cout << "\nTEST 2: Field layout\n";
    {
        Bytes frame;
        encode(Message::makeVote(0x01020304, 0x0A0B0C0D, CHOICE_NO), MTU, frame);
        Bytes expected = {0x02, 0x01, 0x02, 0x03, 0x04, 0x0A, 0x0B, 0x0C, 0x0D, 0x00};
        check(frame == expected, "VOTE = kind, round BE, sequence BE, choice");

        encode(Message::makeAck(0x00000102, 0x00000009), MTU, frame);
        expected = {0x03, 0x00, 0x00, 0x01, 0x02, 0x00, 0x00, 0x00, 0x09};
        check(frame == expected, "ACK = kind, round BE, sequence BE");

        encode(Message::makePrompt(1, bytesOf("OK")), MTU, frame);
        expected = {0x01, 0x00, 0x00, 0x00, 0x01, 0x02, 'O', 'K'};
        check(frame == expected, "PROMPT = kind, round BE, length, payload");

        encode(Message::makeReset(5), MTU, frame);
        check(frame.size() == RESET_SIZE && frame[0] == 0x05, "RESET is a bare 5-byte header");
    }

    // ========================================================================
    // TEST 3: Oversize
    // ========================================================================
    std::cout << "\nTEST 3: Oversize frames\n";
    {
        Bytes frame;
        Bytes fits(MTU - PROMPT_OVERHEAD, 'x');
        check(encode(Message::makePrompt(1, fits), MTU, frame) == CodecError::None &&
              frame.size() == MTU, "prompt filling the MTU exactly encodes");

        Bytes too_big(MTU - PROMPT_OVERHEAD + 1, 'x');
        CodecError err = encode(Message::makePrompt(1, too_big), MTU, frame);
        check(err == CodecError::Oversize && frame.empty(), "one byte over the MTU is Oversize");

        Bytes huge(300, 'x');
        err = encode(Message::makePrompt(1, huge), 1024, frame);
        check(err == CodecError::Oversize, "payload beyond the 1-byte length prefix is Oversize");

        err = encode(Message::makeVote(1, 1, 1), 9, frame);
        check(err == CodecError::Oversize, "VOTE into a 9-byte MTU is Oversize");
    }

    // ========================================================================
    // TEST 4: Malformed input
    // ========================================================================
    std::cout << "\nTEST 4: Malformed frames\n";
    {
        Message out;
        check(decode(Bytes{}, out) == CodecError::Malformed, "empty frame");
        check(decode(Bytes{0x02, 0x00, 0x00}, out) == CodecError::Malformed, "truncated header");

        Bytes vote;
        encode(Message::makeVote(1, 1, CHOICE_YES), MTU, vote);
        Bytes short_vote(vote.begin(), vote.end() - 1);
        check(decode(short_vote, out) == CodecError::Malformed, "VOTE missing its choice byte");

        Bytes long_vote = vote;
        long_vote.push_back(0x00);
        check(decode(long_vote, out) == CodecError::Malformed, "VOTE with a trailing byte");

        Bytes prompt = {0x01, 0x00, 0x00, 0x00, 0x01, 0x05, 'a', 'b'};
        check(decode(prompt, out) == CodecError::Malformed, "PROMPT length prefix beyond the frame");

        Bytes no_len = {0x01, 0x00, 0x00, 0x00, 0x01};
        check(decode(no_len, out) == CodecError::Malformed, "PROMPT without a length byte");

        Bytes close_pad = {0x04, 0x00, 0x00, 0x00, 0x01, 0x00};
        check(decode(close_pad, out) == CodecError::Malformed, "CLOSE with a body");
    }

    // ========================================================================
    // TEST 5: Unknown kinds
    // ========================================================================
    std::cout << "\nTEST 5: Unknown kinds\n";
    {
        Message out;
        Bytes future = {0x42, 0x00, 0x00, 0x00, 0x09, 0xDE, 0xAD, 0xBE, 0xEF};
        CodecError err = decode(future, out);
        check(err == CodecError::None && out.kind == MessageKind::UNKNOWN &&
              out.raw_kind == 0x42 && out.round_id == 9,
              "unknown kind with a body decodes to UNKNOWN with its round id");

        Bytes short_future = {0x42, 0x00};
        check(decode(short_future, out) == CodecError::Malformed,
              "unknown kind still needs the full header");

        Bytes frame;
        check(encode(out, MTU, frame) == CodecError::Malformed, "UNKNOWN cannot be encoded");
    }

    // ========================================================================
    // TEST 6: encodeInto
    // ========================================================================
    std::cout << "\nTEST 6: encodeInto with a caller buffer\n";
    {
        uint8_t buf[32];
        size_t written = 0;
        CodecError err = encodeInto(Message::makeAck(2, 4), MTU, MutableByteSpan(buf, sizeof(buf)), written);
        check(err == CodecError::None && written == ACK_SIZE, "ACK written into a stack buffer");

        uint8_t tiny[4];
        err = encodeInto(Message::makeAck(2, 4), MTU, MutableByteSpan(tiny, sizeof(tiny)), written);
        check(err == CodecError::Oversize, "buffer smaller than the frame is Oversize");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All frame codec tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
