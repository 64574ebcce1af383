#pragma once

#include <istream>
#include <string>

#include "burnlink/core/result.h"
#include "burnlink/links/access_coordinator.h"

namespace burnlink::http {

/// @brief Name of the multipart form field carrying the file.
inline constexpr const char* kFileField = "file";
inline constexpr const char* kDefaultFilename = "upload.bin";
inline constexpr const char* kDefaultContentType = "application/octet-stream";

/// @brief Extract the `file` part of a multipart/form-data body and publish it.
///
/// Other fields are skipped. Errors: kInvalidArgument for a malformed body or
/// a missing `file` field; anything the coordinator reports otherwise.
core::Result<links::LinkTicket> PublishMultipart(std::istream& body,
                                                 const std::string& content_type,
                                                 links::AccessCoordinator& coordinator);

/// @brief Reduce a client-supplied filename to something safe for Content-Disposition.
std::string SanitizeFilename(const std::string& filename);

/// @brief JSON body returned to the uploader.
std::string RenderTicketJson(const links::LinkTicket& ticket, const std::string& public_base_url);

}  // namespace burnlink::http
