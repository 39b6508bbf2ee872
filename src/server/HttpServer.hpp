#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <string>

namespace salescast {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * Serveur HTTP basé sur Boost.Beast
 *
 * Accepte les connexions sur un strand et crée une HttpSession par client.
 * Le port 0 choisit un port libre (voir port()).
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               RequestHandler& handler);

    void run();
    void stop();

    /// Port effectivement lié
    unsigned short port() const { return m_port; }

    size_t connectionCount() const { return m_connections; }

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    RequestHandler& m_handler;
    unsigned short m_port = 0;
    std::atomic<bool> m_running{false};
    std::atomic<size_t> m_connections{0};
};

} // namespace server
} // namespace salescast
