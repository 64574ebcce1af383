#include "burnlink/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace burnlink::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator::defaultGenerator().createOne().toString();
}

std::string GenerateRandomId() {
    // Time-based UUIDs are predictable; link and blob ids must not be.
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

}  // namespace burnlink::core
