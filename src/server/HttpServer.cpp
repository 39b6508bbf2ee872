#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"

namespace salescast {
namespace server {

namespace {

void throwOnError(const beast::error_code& ec, const std::string& what) {
    if (ec) {
        throw std::runtime_error(what + ": " + ec.message());
    }
}

} // anonymous namespace

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
                       RequestHandler& handler)
    : m_ioc(ioc)
    , m_acceptor(net::make_strand(ioc))
    , m_handler(handler)
{
    beast::error_code ec;

    auto bindAddress = net::ip::make_address(address, ec);
    throwOnError(ec, "Invalid listen address '" + address + "'");
    tcp::endpoint endpoint(bindAddress, port);

    m_acceptor.open(endpoint.protocol(), ec);
    throwOnError(ec, "Failed to open acceptor");

    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    throwOnError(ec, "Failed to set reuse_address");

    m_acceptor.bind(endpoint, ec);
    throwOnError(ec, "Failed to bind " + address + ":" + std::to_string(port));

    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    throwOnError(ec, "Failed to listen");

    m_port = m_acceptor.local_endpoint().port();
    LOG_INFO("Server listening on http://" + address + ":" + std::to_string(m_port));
}

void HttpServer::run() {
    m_running = true;
    doAccept();
}

void HttpServer::stop() {
    m_running = false;

    beast::error_code ec;
    m_acceptor.close(ec);
    if (ec) {
        LOG_WARN("Acceptor close: " + ec.message());
    }
    LOG_INFO("Server stopped after " + std::to_string(m_connections) + " connections");
}

void HttpServer::doAccept() {
    if (!m_running) return;

    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                ++m_connections;
                std::make_shared<HttpSession>(std::move(socket), m_handler)->run();
            } else if (m_running) {
                LOG_WARN("Accept error: " + ec.message());
            }

            doAccept();
        });
}

} // namespace server
} // namespace salescast
