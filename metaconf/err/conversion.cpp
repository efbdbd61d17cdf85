#include "metaconf/err/conversion.h"

#include <sstream>
#include <string>

namespace metaconf {
ConversionError::ConversionError(unsigned version, const std::string& msg) {
    std::stringstream ss;
    ss << "Conversion of v" << version << " metadata to latest failed. " << msg;

    this->msg = ss.str();
}

ConversionError::ConversionError(unsigned version, const F& msg): ConversionError(version, msg.ss.str()) {}

const char* ConversionError::what() const noexcept { return msg.data(); }

TypeCollision::TypeCollision(const std::string& name, uint32_t first_id, uint32_t second_id,
                             const std::string& msg) {
    std::stringstream ss;
    ss << "Type name '" << name << "' is used by lookup #" << first_id << " and by lookup #" << second_id
       << " with different definitions. ";

    ss << msg;

    this->msg = ss.str();
}

TypeCollision::TypeCollision(const std::string& name, uint32_t first_id, uint32_t second_id, const F& msg):
        TypeCollision(name, first_id, second_id, msg.ss.str()) {}

const char* TypeCollision::what() const noexcept { return msg.data(); }
}  // namespace metaconf
