#include "burnlink/core/time.h"

#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/Timestamp.h>
#include <Poco/Timespan.h>

namespace burnlink::core {

NowFn SystemNow() {
    return [] { return SteadyClock::now(); };
}

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string NowIso8601WithOffsetSeconds(long long delta_seconds) {
    Poco::Timestamp ts;
    ts += Poco::Timespan(static_cast<long>(delta_seconds), 0);
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FORMAT);
}

}  // namespace burnlink::core
