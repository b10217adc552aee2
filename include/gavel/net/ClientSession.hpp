#ifndef GAVEL_NET_CLIENT_SESSION_HPP
#define GAVEL_NET_CLIENT_SESSION_HPP

#include "gavel/net/Message.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gavel::net {

    using tcp = boost::asio::ip::tcp;

    /**
     * One accepted client connection. Reads frames in a loop, hands each
     * request to the server's callback and queues the response for writing.
     * All socket work runs on the io_context thread.
     */
    class ClientSession : public std::enable_shared_from_this<ClientSession> {
    public:
        using Ptr = std::shared_ptr<ClientSession>;
        using RequestCallback = std::function<Message(const Message&)>;
        using CloseCallback = std::function<void(uint64_t)>;

        ClientSession(boost::asio::io_context& ctx, uint64_t sessionId);

        /**
         * The ClientSession destructor closes the socket with error handling.
         */
        ~ClientSession();

        tcp::socket& socket();

        /**
         * Records the remote endpoint and starts the read loop.
         */
        void start();

        /**
         * Queues a message for writing. Safe to call from any thread.
         */
        void sendMessage(const Message& msg);

        // Cierra el socket; el callback de cierre se invoca una sola vez
        void close();

        void setRequestHandler(RequestCallback cb);
        void setCloseHandler(CloseCallback cb);

        uint64_t id() const { return sessionId; }
        const std::string& remote() const { return remoteEndpoint; }

    private:
        void asyncReadHeader();
        void asyncReadPayload(uint64_t payloadLen);
        void doWrite();
        void handleDisconnect();

        boost::asio::io_context& io;
        tcp::socket sock;
        uint64_t sessionId;
        std::string remoteEndpoint;

        RequestCallback onRequest;
        CloseCallback onClose;

        std::vector<uint8_t> headerBuf;
        std::vector<uint8_t> payloadBuf;
        std::deque<std::vector<uint8_t>> writeQueue;
        bool closed = false;
    };

} // namespace gavel::net

#endif // GAVEL_NET_CLIENT_SESSION_HPP
