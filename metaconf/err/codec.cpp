#include "metaconf/err/codec.h"

#include <sstream>
#include <string>

namespace metaconf {
NotEnoughRoom::NotEnoughRoom(uint32_t at, uint32_t requested_sz, uint32_t available_sz, const std::string& msg) {
    std::stringstream ss;
    ss << "Requested " << requested_sz << " bytes at position " << at << " but only " << available_sz
       << " bytes are available. " << msg;

    this->msg = ss.str();
}

NotEnoughRoom::NotEnoughRoom(uint32_t at, uint32_t requested_sz, uint32_t available_sz, const F& msg):
        NotEnoughRoom(at, requested_sz, available_sz, msg.ss.str()) {}

const char* NotEnoughRoom::what() const noexcept { return msg.data(); }

DecodeError::DecodeError(const std::string& msg) { this->msg = msg; }

DecodeError::DecodeError(const F& msg): DecodeError(msg.ss.str()) {}

DecodeError::DecodeError(uint32_t at, const std::string& msg) {
    std::stringstream ss;
    ss << "Decode failed at byte " << at << ": " << msg;

    this->msg = ss.str();
}

DecodeError::DecodeError(uint32_t at, const F& msg): DecodeError(at, msg.ss.str()) {}

const char* DecodeError::what() const noexcept { return msg.data(); }

EncodeError::EncodeError(const std::string& msg) {
    std::stringstream ss;
    ss << "Encode failed: " << msg;

    this->msg = ss.str();
}

EncodeError::EncodeError(const F& msg): EncodeError(msg.ss.str()) {}

const char* EncodeError::what() const noexcept { return msg.data(); }
}  // namespace metaconf
