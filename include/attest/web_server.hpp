#pragma once

#include "attest/api_router.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace attest
{
    struct WebServerConfig
    {
        std::string bind{"0.0.0.0"};
        std::uint16_t port{3000};
        std::size_t threads{2};
        std::shared_ptr<ApiRouter> router;
    };

    /**
     * HTTP/1.1 server on Boost.Beast. Each request is handed to the
     * ApiRouter and its JSON answer written back.
     */
    class WebServer
    {
    public:
        explicit WebServer(const WebServerConfig &cfg);
        ~WebServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
