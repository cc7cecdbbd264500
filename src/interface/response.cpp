// Response formatting implementation

#include "response.hpp"
#include <sstream>

namespace votelink {
namespace interface {

Response::Response(ResponseType type, const std::string& data)
    : type_(type), data_(data) {}

Response Response::ok() {
    return Response(ResponseType::Ok);
}

Response Response::error(const std::string& msg) {
    return Response(ResponseType::Error, msg);
}

Response Response::state(const std::string& state, uint32_t round_id) {
    return Response(ResponseType::State, state + " " + std::to_string(round_id));
}

Response Response::round(uint32_t round_id) {
    return Response(ResponseType::Round, std::to_string(round_id));
}

Response Response::tally(uint32_t round_id, const std::map<uint8_t, uint32_t>& counts) {
    std::ostringstream oss;
    oss << round_id;
    for (const auto& [choice, count] : counts) {
        oss << " " << static_cast<unsigned>(choice) << "=" << count;
    }
    return Response(ResponseType::Tally, oss.str());
}

Response Response::custom(const std::string& msg) {
    return Response(ResponseType::Custom, msg);
}

Response Response::close() {
    return Response(ResponseType::Close);
}

std::string Response::toString() const {
    std::string result;

    switch (type_) {
        case ResponseType::Ok:
            result = "OK";
            break;
        case ResponseType::Error:
            result = "ERROR " + data_;
            break;
        case ResponseType::State:
            result = "STATE " + data_;
            break;
        case ResponseType::Round:
            result = "ROUND " + data_;
            break;
        case ResponseType::Tally:
            result = "TALLY " + data_;
            break;
        case ResponseType::Custom:
            result = data_;
            break;
        case ResponseType::Close:
            result = "BYE";
            break;
    }

    return result + "\r";
}

std::vector<uint8_t> Response::toBytes() const {
    std::string s = toString();
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace interface
} // namespace votelink
