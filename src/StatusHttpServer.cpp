#include "StatusHttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>

namespace autopark
{
    namespace
    {
        std::string decodePath(const std::string &path)
        {
            if (path == "/" || path == "/status" || path == "/status/")
            {
                return "status";
            }
            if (path == "/grid" || path == "/grid/")
            {
                return "grid";
            }
            if (path == "/events" || path == "/events/")
            {
                return "events";
            }
            if (path == "/config" || path == "/config.json")
            {
                return "config";
            }
            if (path.rfind("/command", 0) == 0)
            {
                return "command";
            }
            return "unknown";
        }

        std::string statusTextFromCode(int status_code)
        {
            switch (status_code)
            {
            case 200:
                return "200 OK";
            case 400:
                return "400 Bad Request";
            case 404:
                return "404 Not Found";
            case 405:
                return "405 Method Not Allowed";
            case 409:
                return "409 Conflict";
            case 500:
                return "500 Internal Server Error";
            default:
                return std::to_string(status_code) + " Unknown";
            }
        }

        int hexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::string urlDecode(const std::string &value)
        {
            std::string decoded;
            decoded.reserve(value.size());
            for (std::size_t i = 0; i < value.size(); ++i)
            {
                if (value[i] == '+')
                {
                    decoded += ' ';
                }
                else if (value[i] == '%' && i + 2 < value.size() &&
                         hexValue(value[i + 1]) >= 0 && hexValue(value[i + 2]) >= 0)
                {
                    decoded += static_cast<char>(hexValue(value[i + 1]) * 16 + hexValue(value[i + 2]));
                    i += 2;
                }
                else
                {
                    decoded += value[i];
                }
            }
            return decoded;
        }

        StatusHttpServer::Reply errorReply(int status_code, const std::string &message)
        {
            return {status_code, "{\"ok\":false,\"error\":\"" + message + "\"}", "application/json"};
        }
    } // namespace

    StatusHttpServer::StatusHttpServer(int port,
                                       JsonProvider status_provider,
                                       JsonProvider grid_provider,
                                       EventsProvider events_provider,
                                       JsonProvider config_provider,
                                       CommandHandler command_handler)
        : port(port),
          server_fd(-1),
          running(false),
          status_provider(std::move(status_provider)),
          grid_provider(std::move(grid_provider)),
          events_provider(std::move(events_provider)),
          config_provider(std::move(config_provider)),
          command_handler(std::move(command_handler))
    {
    }

    StatusHttpServer::~StatusHttpServer()
    {
        stop();
    }

    bool StatusHttpServer::start()
    {
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (server_fd < 0)
        {
            std::cerr << "status server: failed to create socket\n";
            return false;
        }

        int opt = 1;
        setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            std::cerr << "status server: bind failed on port " << port << "\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        if (listen(server_fd, 16) < 0)
        {
            std::cerr << "status server: listen failed\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        running = true;
        accept_thread = std::thread(&StatusHttpServer::acceptLoop, this);
        return true;
    }

    void StatusHttpServer::stop()
    {
        if (!running)
        {
            return;
        }

        running = false;
        if (server_fd >= 0)
        {
            shutdown(server_fd, SHUT_RDWR);
            close(server_fd);
            server_fd = -1;
        }

        if (accept_thread.joinable())
        {
            accept_thread.join();
        }
    }

    void StatusHttpServer::acceptLoop()
    {
        while (running)
        {
            sockaddr_in client_addr{};
            socklen_t len = sizeof(client_addr);
            int client_fd = accept(server_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
            if (client_fd < 0)
            {
                if (running)
                {
                    continue;
                }
                break;
            }

            handleClient(client_fd);
            close(client_fd);
        }
    }

    void StatusHttpServer::handleClient(int client_fd)
    {
        char buffer[8192];
        std::memset(buffer, 0, sizeof(buffer));
        const ssize_t n = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (n <= 0)
        {
            return;
        }

        std::string req(buffer, static_cast<std::size_t>(n));
        std::istringstream input(req);
        std::string method, target, version;
        input >> method >> target >> version;

        const std::string resp = buildHttpResponse(handleRequest(method, target));
        if (send(client_fd, resp.c_str(), resp.size(), 0) < 0)
        {
            std::cerr << "status server: failed to send response\n";
        }
    }

    StatusHttpServer::Reply StatusHttpServer::handleRequest(const std::string &method, const std::string &target) const
    {
        const std::size_t qmark = target.find('?');
        const std::string clean_path = qmark == std::string::npos ? target : target.substr(0, qmark);
        const std::string route = decodePath(clean_path);

        if (route == "unknown")
        {
            return {404, "not found", "text/plain"};
        }

        if (route == "command")
        {
            if (method != "GET" && method != "POST")
            {
                return errorReply(405, "method not allowed");
            }
            return command_handler(parseQuery(target));
        }

        if (method != "GET")
        {
            return errorReply(405, "method not allowed");
        }

        if (route == "status")
        {
            return {200, status_provider(), "application/json"};
        }

        if (route == "grid")
        {
            return {200, grid_provider(), "application/json"};
        }

        if (route == "events")
        {
            std::size_t limit = DEFAULT_EVENT_LIMIT;
            const QueryParams params = parseQuery(target);
            const auto it = params.find("limit");
            if (it != params.end())
            {
                char *end = nullptr;
                const unsigned long parsed = std::strtoul(it->second.c_str(), &end, 10);
                if (it->second.empty() || *end != '\0')
                {
                    return errorReply(400, "limit must be a non-negative integer");
                }
                limit = static_cast<std::size_t>(parsed);
            }
            return {200, events_provider(limit), "application/json"};
        }

        return {200, config_provider(), "application/json"};
    }

    StatusHttpServer::QueryParams StatusHttpServer::parseQuery(const std::string &target)
    {
        QueryParams params;
        const std::size_t qmark = target.find('?');
        if (qmark == std::string::npos)
        {
            return params;
        }

        std::istringstream pairs(target.substr(qmark + 1));
        std::string pair;
        while (std::getline(pairs, pair, '&'))
        {
            if (pair.empty())
            {
                continue;
            }
            const std::size_t eq = pair.find('=');
            if (eq == std::string::npos)
            {
                params[urlDecode(pair)] = "";
            }
            else
            {
                params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        return params;
    }

    std::string StatusHttpServer::buildHttpResponse(const Reply &reply) const
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << statusTextFromCode(reply.status_code) << "\r\n";
        out << "Content-Type: " << reply.content_type << "\r\n";
        out << "Cache-Control: no-store, no-cache, must-revalidate, max-age=0\r\n";
        out << "Content-Length: " << reply.body.size() << "\r\n";
        out << "Connection: close\r\n\r\n";
        out << reply.body;
        return out.str();
    }
} // namespace autopark
