#include "attest/web_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace attest
{
    namespace
    {
        constexpr std::size_t kMaxBodyBytes = 32 * 1024 * 1024; // artifacts arrive inline as base64

        http::response<http::string_body> to_http(const ApiResponse &api, unsigned version)
        {
            http::response<http::string_body> res{static_cast<http::status>(api.status), version};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            res.body() = api.body.dump();
            res.prepare_payload();
            return res;
        }

        std::string verb_name(http::verb v)
        {
            return std::string(http::to_string(v));
        }
    } // namespace

    class WebServer::Impl
    {
    public:
        explicit Impl(WebServerConfig cfg)
            : cfg_(std::move(cfg)),
              ioc_(static_cast<int>(cfg_.threads)),
              acceptor_(ioc_)
        {
            if (!cfg_.router)
                throw std::invalid_argument("WebServer requires a router");
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{net::ip::make_address(cfg_.bind), cfg_.port};
            beast::error_code ec;

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            spdlog::info("Listening on {}:{} with {} thread(s)", cfg_.bind, cfg_.port, cfg_.threads);

            net::signal_set signals(ioc_, SIGINT, SIGTERM);
            signals.async_wait([this](beast::error_code, int signo) {
                spdlog::info("Signal {} received, stopping", signo);
                stop();
            });

            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), *cfg_.router)->run();
            }
            else if (ec != net::error::operation_aborted)
            {
                spdlog::warn("accept failed: {}", ec.message());
            }
            if (acceptor_.is_open())
                do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, const ApiRouter &router)
                : stream_(std::move(socket)),
                  router_(router)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                parser_.emplace();
                parser_->body_limit(kMaxBodyBytes);
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, *parser_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    spdlog::debug("read failed: {}", ec.message());
                    return;
                }

                const auto &req = parser_->get();
                ApiRequest api{verb_name(req.method()), std::string(req.target()), req.body()};
                auto started = std::chrono::steady_clock::now();
                auto api_res = router_.handle(api);
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
                spdlog::debug("{} {} -> {} ({} ms)", api.method, api.target, api_res.status, elapsed.count());

                res_ = to_http(api_res, req.version());
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            std::optional<http::request_parser<http::string_body>> parser_;
            http::response<http::string_body> res_;
            const ApiRouter &router_;
        };

        WebServerConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
    };

    WebServer::WebServer(const WebServerConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace attest
