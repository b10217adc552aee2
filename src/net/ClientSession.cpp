#include "gavel/net/ClientSession.hpp"
#include <iostream>
#include <stdexcept>

namespace gavel::net {

    ClientSession::ClientSession(boost::asio::io_context& ctx, uint64_t sessionId)
        : io(ctx), sock(ctx), sessionId(sessionId), headerBuf(MESSAGE_HEADER_SIZE) {}

    ClientSession::~ClientSession() {
        boost::system::error_code ec;
        sock.close(ec);
    }

    tcp::socket& ClientSession::socket() { return sock; }

    void ClientSession::setRequestHandler(RequestCallback cb) { onRequest = std::move(cb); }

    void ClientSession::setCloseHandler(CloseCallback cb) { onClose = std::move(cb); }

    void ClientSession::start() {
        boost::system::error_code ec;
        auto endpoint = sock.remote_endpoint(ec);
        if (!ec) {
            remoteEndpoint = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
        asyncReadHeader();
    }

    void ClientSession::asyncReadHeader() {
        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(headerBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect();
                    return;
                }
                Message header;
                uint64_t payloadLen = 0;
                if (!parseMessageHeader(headerBuf, header, payloadLen)) {
                    std::cerr << "Warning: Malformed frame header from " << remoteEndpoint << std::endl;
                    handleDisconnect();
                    return;
                }
                asyncReadPayload(payloadLen);
            });
    }

    void ClientSession::asyncReadPayload(uint64_t payloadLen) {
        // payload + checksum(4)
        payloadBuf.resize(static_cast<size_t>(payloadLen) + CHECKSUM_SIZE);
        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(payloadBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect();
                    return;
                }

                // cabecera + payload + crc para validar el frame completo
                std::vector<uint8_t> full;
                full.reserve(headerBuf.size() + payloadBuf.size());
                full.insert(full.end(), headerBuf.begin(), headerBuf.end());
                full.insert(full.end(), payloadBuf.begin(), payloadBuf.end());

                Message request;
                if (!parseFullMessage(full, request)) {
                    std::cerr << "Warning: Corrupted frame from " << remoteEndpoint << std::endl;
                    handleDisconnect();
                    return;
                }

                if (request.type == RequestType::DISCONNECT) {
                    handleDisconnect();
                    return;
                }

                if (onRequest) {
                    try {
                        sendMessage(onRequest(request));
                    } catch (const std::exception& e) {
                        std::cerr << "Error: Request from " << remoteEndpoint << " failed: " << e.what() << std::endl;
                        handleDisconnect();
                        return;
                    }
                }

                asyncReadHeader();
            });
    }

    void ClientSession::sendMessage(const Message& msg) {
        std::vector<uint8_t> frame = serializeMessage(msg);
        auto self = shared_from_this();
        boost::asio::post(io, [this, self, frame = std::move(frame)]() mutable {
            if (closed) return;
            bool writing = !writeQueue.empty();
            writeQueue.push_back(std::move(frame));
            if (!writing) doWrite();
        });
    }

    void ClientSession::doWrite() {
        auto self = shared_from_this();
        boost::asio::async_write(sock, boost::asio::buffer(writeQueue.front()),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect();
                    return;
                }
                writeQueue.pop_front();
                if (!writeQueue.empty()) doWrite();
            });
    }

    void ClientSession::close() {
        auto self = shared_from_this();
        boost::asio::post(io, [this, self]() { handleDisconnect(); });
    }

    void ClientSession::handleDisconnect() {
        if (closed) return;
        closed = true;

        boost::system::error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);

        if (onClose) onClose(sessionId);
    }

} // namespace gavel::net
