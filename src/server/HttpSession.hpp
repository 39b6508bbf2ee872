#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <memory>
#include <optional>

namespace salescast {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;
struct Reply;

/**
 * Une connexion client: lecture, dispatch vers RequestHandler, écriture,
 * en boucle tant que le client garde la connexion ouverte.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using Response = http::response<http::string_body>;

    static constexpr std::size_t BODY_LIMIT = 1024 * 1024;
    static constexpr std::chrono::seconds IDLE_TIMEOUT{30};

    HttpSession(tcp::socket socket, RequestHandler& handler);

    void run();

    /// En-têtes CORS et serveur, appliqués à toutes les réponses
    static void applyCommonHeaders(Response& res);
    static Response toResponse(Reply reply, unsigned version, bool keepAlive);

private:
    void readNext();
    void onRequest(beast::error_code ec);
    void onResponseSent(bool close, beast::error_code ec);
    void shutdown();

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    std::shared_ptr<Response> m_pending;
    RequestHandler& m_handler;
};

} // namespace server
} // namespace salescast
