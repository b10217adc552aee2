#include "gavel/net/AuctionServer.hpp"
#include <iostream>

namespace gavel::net {

    AuctionServer::AuctionServer(uint16_t listenPort, RequestHandler& handler)
        : io(),
          workGuard(boost::asio::make_work_guard(io)),
          acceptor(io, tcp::endpoint(tcp::v4(), listenPort)),
          handler(handler) {}

    AuctionServer::~AuctionServer() {
        stop();
    }

    void AuctionServer::start() {
        if (running) return;
        running = true;
        doAccept();
        // io_context en un hilo de fondo
        ioThread = std::thread([this] { io.run(); });
        std::cout << "Auction server listening on port " << port() << std::endl;
    }

    void AuctionServer::stop() {
        if (!running) return;
        running = false;
        workGuard.reset();

        boost::asio::post(io, [this] {
            boost::system::error_code ec;
            acceptor.close(ec);
        });

        // Cerrar sesiones
        {
            std::lock_guard<std::mutex> lk(sessionMtx);
            for (auto& kv : sessions) {
                kv.second->close();
            }
        }

        if (ioThread.joinable()) ioThread.join();

        {
            std::lock_guard<std::mutex> lk(sessionMtx);
            sessions.clear();
        }
        std::cout << "Auction server stopped" << std::endl;
    }

    uint16_t AuctionServer::port() const {
        boost::system::error_code ec;
        auto endpoint = acceptor.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    size_t AuctionServer::sessionCount() const {
        std::lock_guard<std::mutex> lk(sessionMtx);
        return sessions.size();
    }

    void AuctionServer::doAccept() {
        uint64_t sessionId;
        {
            std::lock_guard<std::mutex> lk(sessionMtx);
            sessionId = nextSessionId++;
        }

        auto session = std::make_shared<ClientSession>(io, sessionId);
        acceptor.async_accept(session->socket(), [this, session](const boost::system::error_code& ec) {
            if (!ec) {
                bool accepted = false;
                {
                    std::lock_guard<std::mutex> lk(sessionMtx);
                    if (sessions.size() < MAX_CLIENTS) {
                        sessions[session->id()] = session;
                        accepted = true;
                    }
                }

                if (accepted) {
                    session->setRequestHandler([this](const Message& request) {
                        return handler.handle(request);
                    });
                    session->setCloseHandler([this](uint64_t id) { removeSession(id); });
                    session->start();
                } else {
                    std::cerr << "Warning: Client limit reached (" << MAX_CLIENTS << "), refusing connection" << std::endl;
                    boost::system::error_code closeEc;
                    session->socket().close(closeEc);
                }
            } else if (ec != boost::asio::error::operation_aborted) {
                std::cerr << "Warning: Accept failed: " << ec.message() << std::endl;
            }

            if (running) doAccept();
        });
    }

    void AuctionServer::removeSession(uint64_t sessionId) {
        std::lock_guard<std::mutex> lk(sessionMtx);
        sessions.erase(sessionId);
    }

} // namespace gavel::net
