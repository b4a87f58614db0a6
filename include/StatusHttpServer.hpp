#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace autopark
{
    class StatusHttpServer
    {
    public:
        struct Reply
        {
            int status_code = 200;
            std::string body;
            std::string content_type = "application/json";
        };

        using QueryParams = std::map<std::string, std::string>;
        using JsonProvider = std::function<std::string()>;
        using EventsProvider = std::function<std::string(std::size_t limit)>;
        using CommandHandler = std::function<Reply(const QueryParams &)>;

        static constexpr std::size_t DEFAULT_EVENT_LIMIT = 50;

        StatusHttpServer(int port,
                         JsonProvider status_provider,
                         JsonProvider grid_provider,
                         EventsProvider events_provider,
                         JsonProvider config_provider,
                         CommandHandler command_handler);
        ~StatusHttpServer();

        StatusHttpServer(const StatusHttpServer &) = delete;
        StatusHttpServer &operator=(const StatusHttpServer &) = delete;

        bool start();
        void stop();
        bool isRunning() const { return running; }

        // Routes a request line without touching sockets
        Reply handleRequest(const std::string &method, const std::string &target) const;

        // "a=1&b=x%20y" -> {a: 1, b: "x y"}; reads only what follows '?'
        static QueryParams parseQuery(const std::string &target);

    private:
        void acceptLoop();
        void handleClient(int client_fd);
        std::string buildHttpResponse(const Reply &reply) const;

        int port;
        int server_fd;
        std::atomic<bool> running;
        std::thread accept_thread;
        JsonProvider status_provider;
        JsonProvider grid_provider;
        EventsProvider events_provider;
        JsonProvider config_provider;
        CommandHandler command_handler;
    };
} // namespace autopark
