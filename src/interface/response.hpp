// Response formatting for the operator console

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace votelink {
namespace interface {

// Response types
enum class ResponseType {
    Ok,
    Error,
    State,
    Round,
    Tally,
    Custom,
    Close,
};

// Response class for formatting console responses
class Response {
public:
    // Factory methods
    static Response ok();
    static Response error(const std::string& msg);
    static Response state(const std::string& state, uint32_t round_id);
    static Response round(uint32_t round_id);
    static Response tally(uint32_t round_id, const std::map<uint8_t, uint32_t>& counts);
    static Response custom(const std::string& msg);
    static Response close();

    // Format as string (CR terminated)
    std::string toString() const;

    // Format as bytes
    std::vector<uint8_t> toBytes() const;

    // Get response type
    ResponseType type() const { return type_; }

    // Check if this response should end the session
    bool shouldClose() const { return type_ == ResponseType::Close; }

private:
    ResponseType type_;
    std::string data_;

    Response(ResponseType type, const std::string& data = "");
};

} // namespace interface
} // namespace votelink
