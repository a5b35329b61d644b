#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>
#include <optional>

namespace tablescope {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * Session HTTP - gère une connexion client
 *
 * Les requêtes sont traitées sur l'exécuteur de la socket, c'est-à-dire
 * le thread de contrôle quand l'io_context n'a qu'un thread.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, RequestHandler& handler);

    void run();

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(http::response<http::string_body> response);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void doClose();

    // Traitement des requêtes
    http::response<http::string_body> handleRequest(
        http::request<http::string_body>&& req);

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    RequestHandler& m_handler;
};

} // namespace server
} // namespace tablescope
