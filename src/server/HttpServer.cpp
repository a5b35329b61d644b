#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"

namespace tablescope {
namespace server {

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
                       RequestHandler& handler)
    : m_ioc(ioc)
    , m_acceptor(ioc)
    , m_handler(handler)
    , m_running(false)
{
    beast::error_code ec;

    auto endpoint = tcp::endpoint(net::ip::make_address(address), port);

    // Ouvrir l'acceptor
    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    // Permettre la réutilisation de l'adresse
    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set reuse_address: " + ec.message());
    }

    // Lier à l'endpoint
    m_acceptor.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    // Commencer à écouter
    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }

    LOG_INFO("Server listening on http://" + address + ":" + std::to_string(this->port()));
}

void HttpServer::run() {
    m_running = true;
    doAccept();
}

void HttpServer::stop() {
    m_running = false;
    beast::error_code ec;
    m_acceptor.close(ec);
}

unsigned short HttpServer::port() const {
    beast::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::doAccept() {
    if (!m_running) return;

    // Toutes les connexions partagent l'exécuteur de l'io_context : un seul
    // thread de contrôle manipule le workspace
    m_acceptor.async_accept(
        m_ioc,
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), m_handler)->run();
            } else if (ec != net::error::operation_aborted) {
                LOG_WARN("Accept error: " + ec.message());
            }

            if (m_running) {
                doAccept();
            }
        });
}

} // namespace server
} // namespace tablescope
