#ifndef GAVEL_NET_AUCTION_SERVER_HPP
#define GAVEL_NET_AUCTION_SERVER_HPP

#include "gavel/net/ClientSession.hpp"
#include "gavel/net/RequestHandler.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace gavel::net {

    /**
     * TCP front end of the engine: accepts clients on listenPort and runs
     * the io_context on a background thread. Port 0 binds an ephemeral port,
     * reported by port().
     */
    class AuctionServer {
        public:
            AuctionServer(uint16_t listenPort, RequestHandler& handler);
            ~AuctionServer();

            AuctionServer(const AuctionServer&) = delete;
            AuctionServer& operator=(const AuctionServer&) = delete;

            void start();
            void stop();

            uint16_t port() const;
            size_t sessionCount() const;
            bool isRunning() const { return running; }

        private:
            void doAccept();
            void removeSession(uint64_t sessionId);

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            tcp::acceptor acceptor;

            RequestHandler& handler;

            std::unordered_map<uint64_t, ClientSession::Ptr> sessions;
            mutable std::mutex sessionMtx;
            uint64_t nextSessionId = 1;

            // hilo para io
            std::thread ioThread;
            std::atomic<bool> running{false};
    };

} // namespace gavel::net

#endif // GAVEL_NET_AUCTION_SERVER_HPP
