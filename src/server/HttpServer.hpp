#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>

namespace tablescope {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * Serveur HTTP basé sur Boost.Beast
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               RequestHandler& handler);

    void run();
    void stop();

    /// Port effectivement lié (utile avec le port 0)
    unsigned short port() const;

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    RequestHandler& m_handler;
    bool m_running;
};

} // namespace server
} // namespace tablescope
