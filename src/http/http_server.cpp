#include "burnlink/http/http_server.h"

#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/crypto.h>

#include <fcntl.h>
#include <unistd.h>

#include "burnlink/core/ids.h"
#include "burnlink/core/logger.h"
#include "burnlink/http/upload_form.h"
#include "burnlink/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 8192;
constexpr const char* kUploadPath = "/upload";
constexpr const char* kDownloadPattern = "/d/{id}";

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::string Trim(const std::string& input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return input.substr(start, end - start);
}

bool SecretsEqual(const std::string& a, const std::string& b) {
    // Length is not secret; the contents are compared in constant time.
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

http::status StatusFor(burnlink::core::ErrorCode code) {
    switch (code) {
        case burnlink::core::ErrorCode::kInvalidArgument:
            return http::status::bad_request;
        case burnlink::core::ErrorCode::kNotFound:
        case burnlink::core::ErrorCode::kGone:
            return http::status::not_found;
        case burnlink::core::ErrorCode::kUnauthorized:
            return http::status::unauthorized;
        case burnlink::core::ErrorCode::kTooLarge:
            return http::status::payload_too_large;
        default:
            return http::status::internal_server_error;
    }
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, burnlink::http::Router router, burnlink::core::Config config,
            std::shared_ptr<burnlink::links::AccessCoordinator> coordinator)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          config_(std::move(config)),
          coordinator_(std::move(coordinator)) {
    }

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            burnlink::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(config_.server.limits.max_body_bytes);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }

        request_id_ = burnlink::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_remote_ = GetRemoteAddress();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        if (ec == http::error::body_limit) {
            // Declared Content-Length already exceeds the limit.
            return SendTooLarge();
        }
        if (ec) {
            burnlink::core::LogError("Read header failed: " + ec.message());
            return;
        }

        const auto path = StripQuery(request_target_);
        const auto method = parser_->get().method();

        // Fast-path: spool uploads to disk to avoid buffering large bodies in memory.
        if (method == http::verb::post && path == kUploadPath) {
            // Check the secret before reading any of the body.
            auto auth_response = EnsureUploadAuthorized();
            if (auth_response) {
                auth_response->keep_alive(false);
                return Send(std::move(*auth_response));
            }
            StartUpload();
            return;
        }

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        ReadBodyToString();
    }

    void ReadBodyToString() {
        body_.clear();
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            return SendTooLarge();
        }
        if (ec && ec != http::error::need_buffer) {
            burnlink::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        burnlink::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name_string(), field.value());
        }
        request.body() = body_;
        request.prepare_payload();
        request.keep_alive(parser_->get().keep_alive());

        burnlink::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = std::string(request.method_string());
        ctx.target = std::string(request.target());
        ctx.remote = request_remote_;

        const auto path = StripQuery(std::string(request.target()));
        burnlink::http::RouteParams params;
        if (request.method() == http::verb::get &&
            burnlink::http::Router::Match(kDownloadPattern, path, &params)) {
            return HandleDownload(request, params["id"]);
        }

        auto result = router_.Route(ctx, request);
        if (!result.ok()) {
            auto response = burnlink::http::ErrorResponse(
                http::status::internal_server_error, request.version(), "INTERNAL",
                result.error().message, request_id_);
            return Send(std::move(response));
        }
        result.value().keep_alive(request.keep_alive());
        Send(result.take());
    }

    std::optional<burnlink::http::HttpResponse> EnsureUploadAuthorized() {
        const auto& secret = config_.auth.upload_secret;
        if (secret.empty()) {
            return std::nullopt;
        }
        // Expect "Authorization: Bearer <secret>".
        const auto& request = parser_->get();
        auto it = request.find(http::field::authorization);
        std::string token;
        if (it != request.end()) {
            std::string value = Trim(std::string(it->value()));
            if (value.size() > 7) {
                std::string prefix = value.substr(0, 7);
                for (auto& c : prefix) {
                    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
                if (prefix == "bearer ") {
                    token = Trim(value.substr(7));
                }
            }
        }
        if (token.empty() || !SecretsEqual(token, secret)) {
            return burnlink::http::ErrorResponse(http::status::unauthorized,
                                                 request.version(), "UNAUTHORIZED",
                                                 "missing or invalid upload secret",
                                                 request_id_);
        }
        return std::nullopt;
    }

    void StartUpload() {
        upload_content_type_ = std::string(parser_->get()[http::field::content_type]);
        upload_spool_path_ =
            (std::filesystem::path(config_.storage.temp_path) /
             (burnlink::core::GenerateRandomId() + ".upload"))
                .string();

        upload_fd_ =
            ::open(upload_spool_path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
        if (upload_fd_ < 0) {
            auto response = burnlink::http::ErrorResponse(
                http::status::internal_server_error, parser_->get().version(), "IO_ERROR",
                "failed to open spool file", request_id_);
            response.keep_alive(false);
            return Send(std::move(response));
        }

        if (parser_->is_done()) {
            return FinishUpload();
        }
        DoReadUploadChunk();
    }

    void DoReadUploadChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnUploadChunk,
                                                   this->shared_from_this()));
    }

    void OnUploadChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            DiscardSpool();
            return SendTooLarge();
        }
        if (ec && ec != http::error::need_buffer) {
            burnlink::core::LogError("Read upload failed: " + ec.message());
            DiscardSpool();
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        std::size_t offset = 0;
        while (offset < bytes) {
            const ssize_t written =
                ::write(upload_fd_, body_buffer_.data() + offset, bytes - offset);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return FailUpload("failed to write spool file");
            }
            offset += static_cast<std::size_t>(written);
        }

        if (parser_->is_done()) {
            return FinishUpload();
        }
        DoReadUploadChunk();
    }

    void FinishUpload() {
        ::close(upload_fd_);
        upload_fd_ = -1;

        const auto version = parser_->get().version();
        const bool keep_alive = parser_->get().keep_alive();
        std::ifstream spool(upload_spool_path_, std::ios::binary);
        if (!spool.is_open()) {
            return FailUpload("failed to reopen spool file");
        }
        auto published =
            burnlink::http::PublishMultipart(spool, upload_content_type_, *coordinator_);
        spool.close();
        DiscardSpool();

        if (!published.ok()) {
            const auto code = published.code();
            auto response = burnlink::http::ErrorResponse(
                StatusFor(code), version,
                code == burnlink::core::ErrorCode::kInvalidArgument
                    ? "INVALID_UPLOAD"
                    : burnlink::core::ErrorCodeName(code),
                published.error().message, request_id_);
            response.keep_alive(keep_alive);
            return Send(std::move(response));
        }

        auto response = burnlink::http::JsonResponse(
            http::status::ok, version,
            burnlink::http::RenderTicketJson(published.value(),
                                             config_.links.public_base_url));
        response.keep_alive(keep_alive);
        Send(std::move(response));
    }

    void FailUpload(const std::string& message) {
        DiscardSpool();
        auto response = burnlink::http::ErrorResponse(http::status::internal_server_error,
                                                      parser_->get().version(), "IO_ERROR",
                                                      message, request_id_);
        response.keep_alive(false);
        Send(std::move(response));
    }

    void DiscardSpool() {
        if (upload_fd_ >= 0) {
            ::close(upload_fd_);
            upload_fd_ = -1;
        }
        if (!upload_spool_path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(upload_spool_path_, ec);
            upload_spool_path_.clear();
        }
    }

    void HandleDownload(const burnlink::http::HttpRequest& request, const std::string& link_id) {
        auto grant = coordinator_->HandleDownload(link_id);
        if (!grant.ok()) {
            const auto code = grant.code();
            std::string error_code = burnlink::core::ErrorCodeName(code);
            if (code == burnlink::core::ErrorCode::kNotFound) {
                error_code = "LINK_NOT_FOUND";
            } else if (code == burnlink::core::ErrorCode::kGone) {
                error_code = "LINK_GONE";
            }
            auto response = burnlink::http::ErrorResponse(StatusFor(code), request.version(),
                                                          error_code, grant.error().message,
                                                          request_id_);
            response.keep_alive(request.keep_alive());
            return Send(std::move(response));
        }

        auto& granted = grant.value();
        beast::error_code ec;
        beast::file file;
        file.native_handle(granted.blob.Release());
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().reset(std::move(file), ec);
        if (ec) {
            auto err = burnlink::http::ErrorResponse(http::status::internal_server_error,
                                                     request.version(), "IO_ERROR",
                                                     "failed to read stored file", request_id_);
            return Send(std::move(err));
        }

        const auto& blob = granted.entry.blob;
        response.set(http::field::content_type, blob.content_type.empty()
                                                    ? std::string(burnlink::http::kDefaultContentType)
                                                    : blob.content_type);
        response.set(http::field::content_disposition,
                     "attachment; filename=\"" + blob.filename + "\"");
        response.set(http::field::cache_control, "no-store");
        response.set("X-Remaining-Downloads", std::to_string(granted.remaining));
        response.content_length(response.body().size());
        response.keep_alive(request.keep_alive());
        Send(std::move(response));
    }

    void SendTooLarge() {
        auto response = burnlink::http::ErrorResponse(
            http::status::payload_too_large, parser_->get().version(), "PAYLOAD_TOO_LARGE",
            "request body exceeds " + std::to_string(config_.server.limits.max_body_bytes) +
                " bytes",
            request_id_);
        // The rest of the body is still in flight; the connection cannot be reused.
        response.keep_alive(false);
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "burnlink");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        burnlink::core::LogRequest(request_id_, request_method_, request_target_, request_remote_,
                                   response.result_int(), latency);
        burnlink::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            // A client that disconnects mid-download keeps its grant consumed.
            burnlink::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    burnlink::http::Router router_;
    burnlink::core::Config config_;
    std::shared_ptr<burnlink::links::AccessCoordinator> coordinator_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;

    std::string upload_content_type_;
    std::string upload_spool_path_;
    int upload_fd_{-1};
};

}  // namespace

namespace burnlink::http {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, Router router, core::Config config,
             std::shared_ptr<links::AccessCoordinator> coordinator, net::ssl::context* ssl_ctx)
        : ioc_(ioc),
          acceptor_(net::make_strand(ioc)),
          router_(std::move(router)),
          config_(std::move(config)),
          coordinator_(std::move(coordinator)),
          ssl_ctx_(ssl_ctx) {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    }

    void Run() { DoAccept(); }

    void Close() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

private:
    void DoAccept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, coordinator_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             coordinator_)
                    ->Start();
            }
        }
        DoAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Router router_;
    core::Config config_;
    std::shared_ptr<links::AccessCoordinator> coordinator_;
    net::ssl::context* ssl_ctx_{nullptr};
};

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<links::LinkRegistry> registry,
                       std::shared_ptr<storage::BlobStore> store)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      registry_(std::move(registry)),
      store_(std::move(store)) {
    coordinator_ = std::make_shared<links::AccessCoordinator>(
        registry_, store_, links::LinkPolicy{config_.links.max_downloads, config_.links.ttl});
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

HttpServer::~HttpServer() = default;

void HttpServer::Run() {
    if (config_.cleanup.enabled) {
        sweeper_ = std::make_unique<links::ExpirySweeper>(ioc_, registry_, store_,
                                                          config_.cleanup.sweep_interval);
        sweeper_->Start();
    }

    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    listener_ = std::make_shared<Listener>(ioc_, endpoint, router_, config_, coordinator_,
                                           ssl_context_ ? ssl_context_.get() : nullptr);
    listener_->Run();
    core::LogInfo("listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port));
}

void HttpServer::Stop() {
    if (sweeper_) {
        sweeper_->Stop();
    }
    if (listener_) {
        listener_->Close();
    }
}

}  // namespace burnlink::http
