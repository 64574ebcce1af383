#include "burnlink/http/upload_form.h"

#include <limits>
#include <sstream>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/Net/MediaType.h>
#include <Poco/Net/MessageHeader.h>
#include <Poco/Net/MultipartReader.h>
#include <Poco/Net/NameValueCollection.h>

namespace burnlink::http {

core::Result<links::LinkTicket> PublishMultipart(std::istream& body,
                                                 const std::string& content_type,
                                                 links::AccessCoordinator& coordinator) {
    try {
        Poco::Net::MediaType media(content_type);
        if (!media.matches("multipart", "form-data") || !media.hasParameter("boundary")) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "expected multipart/form-data with a boundary"};
        }

        Poco::Net::MultipartReader reader(body, media.getParameter("boundary"));
        while (reader.hasNextPart()) {
            Poco::Net::MessageHeader header;
            reader.nextPart(header);
            std::istream& part = reader.stream();

            std::string disposition;
            Poco::Net::NameValueCollection params;
            Poco::Net::MessageHeader::splitParameters(
                header.get("Content-Disposition", ""), disposition, params);
            if (params.get("name", "") != kFileField) {
                // Drain so the reader can find the next boundary.
                part.ignore(std::numeric_limits<std::streamsize>::max());
                continue;
            }

            links::FileInfo info;
            info.filename = SanitizeFilename(params.get("filename", ""));
            info.content_type = header.get("Content-Type", kDefaultContentType);
            return coordinator.Publish(part, info);
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "malformed multipart body: " + ex.displayText()};
    }
    return core::Error{core::ErrorCode::kInvalidArgument,
                       "expected multipart field named 'file'"};
}

std::string SanitizeFilename(const std::string& filename) {
    // Browsers may send a full client path; keep only the last component.
    const auto slash = filename.find_last_of("/\\");
    const auto base = slash == std::string::npos ? filename : filename.substr(slash + 1);
    std::string out;
    out.reserve(base.size());
    for (char c : base) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || c == '"' || c == '\\' || c == '/') {
            out += '_';
        } else {
            out += c;
        }
    }
    if (out.empty() || out == "." || out == "..") {
        return kDefaultFilename;
    }
    return out;
}

std::string RenderTicketJson(const links::LinkTicket& ticket,
                             const std::string& public_base_url) {
    Poco::JSON::Object root;
    root.set("url", public_base_url + ticket.path);
    root.set("id", ticket.link_id);
    root.set("remaining_downloads", static_cast<Poco::UInt64>(ticket.remaining_downloads));
    root.set("expires_in_seconds", static_cast<Poco::Int64>(ticket.expires_in_seconds));
    root.set("expires_at", ticket.expires_at);
    root.set("size", static_cast<Poco::UInt64>(ticket.size_bytes));
    std::stringstream ss;
    root.stringify(ss);
    return ss.str();
}

}  // namespace burnlink::http
