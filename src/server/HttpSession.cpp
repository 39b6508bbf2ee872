#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"

namespace salescast {
namespace server {

HttpSession::HttpSession(tcp::socket socket, RequestHandler& handler)
    : m_stream(std::move(socket))
    , m_handler(handler)
{
}

void HttpSession::run() {
    net::dispatch(m_stream.get_executor(),
                  beast::bind_front_handler(&HttpSession::readNext, shared_from_this()));
}

void HttpSession::applyCommonHeaders(Response& res) {
    res.set(http::field::server, "SalesCast/1.0");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

HttpSession::Response HttpSession::toResponse(Reply reply, unsigned version, bool keepAlive) {
    Response res{static_cast<http::status>(reply.status), version};
    applyCommonHeaders(res);
    if (!reply.contentType.empty()) {
        res.set(http::field::content_type, reply.contentType);
        res.set(http::field::cache_control, "no-store");
    }
    if (!reply.attachment.empty()) {
        res.set(http::field::content_disposition,
                "attachment; filename=\"" + reply.attachment + "\"");
    }
    res.keep_alive(keepAlive);
    res.body() = std::move(reply.body);
    res.prepare_payload();
    return res;
}

void HttpSession::readNext() {
    // Parser neuf par requête: la limite de corps est par message
    m_parser.emplace();
    m_parser->body_limit(BODY_LIMIT);
    m_stream.expires_after(IDLE_TIMEOUT);

    http::async_read(m_stream, m_buffer, *m_parser,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->onRequest(ec);
        });
}

void HttpSession::onRequest(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
        return shutdown();
    }
    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
        }
        return;
    }

    auto req = m_parser->release();
    std::string method(req.method_string());
    std::string target(req.target());

    auto& logger = Logger::instance();
    auto trace = logger.logRequest(method, target);

    Reply reply = m_handler.handle(method, target);
    m_pending = std::make_shared<Response>(
        toResponse(std::move(reply), req.version(), req.keep_alive()));
    logger.logResponse(trace, static_cast<int>(m_pending->result_int()), m_pending->body().size());

    bool close = m_pending->need_eof();
    http::async_write(m_stream, *m_pending,
        [self = shared_from_this(), close](beast::error_code writeEc, std::size_t) {
            self->onResponseSent(close, writeEc);
        });
}

void HttpSession::onResponseSent(bool close, beast::error_code ec) {
    m_pending.reset();
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }
    if (close) {
        return shutdown();
    }
    readNext();
}

void HttpSession::shutdown() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace server
} // namespace salescast
