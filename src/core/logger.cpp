#include "burnlink/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Exception.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace burnlink::core {

namespace {
Poco::Logger& RootLogger() {
    return Poco::Logger::get("burnlink");
}

// One JSON object per line so log shippers can parse events without a grammar.
std::string ToLine(const Poco::JSON::Object& event) {
    std::ostringstream out;
    event.stringify(out);
    return out.str();
}
}  // namespace

bool IsValidLogLevel(const std::string& level) {
    try {
        Poco::Logger::parseLevel(level);
        return true;
    } catch (const Poco::InvalidArgumentException&) {
        return false;
    }
}

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %t"));
    formatter->setProperty("times", "UTC");
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    RootLogger().setChannel(channel);
    RootLogger().setLevel(IsValidLogLevel(level) ? Poco::Logger::parseLevel(level)
                                                 : Poco::Message::PRIO_INFORMATION);
}

void LogInfo(const std::string& message) { RootLogger().information(message); }
void LogWarning(const std::string& message) { RootLogger().warning(message); }
void LogError(const std::string& message) { RootLogger().error(message); }
void LogDebug(const std::string& message) { RootLogger().debug(message); }

void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms) {
    if (!RootLogger().information()) {
        return;
    }
    Poco::JSON::Object event;
    event.set("event", "http_request");
    event.set("request_id", request_id);
    event.set("method", method);
    event.set("target", target);
    event.set("remote", remote);
    event.set("status", status);
    event.set("latency_ms", static_cast<Poco::Int64>(latency_ms));
    LogInfo(ToLine(event));
}

void LogLinkEvent(const std::string& event, const std::string& link_id,
                  const std::string& detail) {
    if (!RootLogger().debug()) {
        return;
    }
    Poco::JSON::Object line;
    line.set("event", "link_" + event);
    line.set("link_id", link_id);
    line.set("detail", detail);
    LogDebug(ToLine(line));
}

}  // namespace burnlink::core
