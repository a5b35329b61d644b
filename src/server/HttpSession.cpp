#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"

namespace tablescope {
namespace server {

namespace {

constexpr const char* kServerName = "TableScope/1.0";
constexpr std::uint64_t kBodyLimit = 50 * 1024 * 1024;
constexpr auto kReadTimeout = std::chrono::seconds(30);

using Response = http::response<http::string_body>;

Response baseResponse(http::status status, unsigned version, bool keepAlive) {
    Response res{status, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.keep_alive(keepAlive);
    return res;
}

Response jsonResponse(unsigned status, const json& body, unsigned version, bool keepAlive) {
    auto res = baseResponse(static_cast<http::status>(status), version, keepAlive);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

} // namespace

HttpSession::HttpSession(tcp::socket socket, RequestHandler& handler)
    : m_stream(std::move(socket))
    , m_handler(handler)
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(kBodyLimit);
    m_stream.expires_after(kReadTimeout);

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    // Corps trop gros : on répond puis on ferme, le flux n'est plus exploitable
    if (ec == http::error::body_limit) {
        LOG_WARN("Request body exceeds " + Logger::formatSize(kBodyLimit));
        auto res = jsonResponse(413, json{{"status", "error"}, {"message", "Request body too large"}},
                                11, false);
        return sendResponse(std::move(res));
    }

    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
        }
        return;
    }

    sendResponse(handleRequest(m_parser->release()));
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<Response>(std::move(response));
    bool needEof = sp->need_eof();

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& logger = Logger::instance();
    std::string target(req.target());
    std::string method(req.method_string());

    auto trace = logger.beginRequest(method, target, req.body());

    // Préflight CORS
    if (req.method() == http::verb::options) {
        auto res = baseResponse(http::status::no_content, req.version(), req.keep_alive());
        res.prepare_payload();
        logger.endRequest(trace, 204, 0);
        return res;
    }

    auto [status, body] = m_handler.route(method, target, req.body());
    auto res = jsonResponse(status, body, req.version(), req.keep_alive());
    logger.endRequest(trace, static_cast<int>(status), res.body().size(), res.body());
    return res;
}

} // namespace server
} // namespace tablescope
