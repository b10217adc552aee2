#ifndef GAVEL_NET_REQUEST_HANDLER_HPP
#define GAVEL_NET_REQUEST_HANDLER_HPP

#include "gavel/AuctionEngine.hpp"
#include "gavel/net/Message.hpp"
#include <functional>
#include <mutex>
#include <unordered_map>

namespace gavel::net {

    /**
     * Turns request frames into engine calls.
     *
     * The caller is the address derived from the request's public key; the
     * signature must cover type, nonce and body, and each address's nonces
     * must strictly increase. now comes from the server clock.
     *
     * Always answers with a RESPONSE message: status 0 on success, the
     * ErrorCode of a rejected operation, or STATUS_BAD_REQUEST for frames
     * that cannot be decoded or verified.
     */
    class RequestHandler {
        public:
            using Clock = std::function<Timestamp()>;

            explicit RequestHandler(AuctionEngine& engine, Clock clock = systemClock);

            Message handle(const Message& request);

            // Segundos desde epoch
            static Timestamp systemClock();

        private:
            Response dispatch(RequestType type, const CallContext& ctx, const std::vector<uint8_t>& body);

            // Acepta el nonce si es mayor que el último visto para la dirección
            bool acceptNonce(const Address& caller, uint64_t nonce);

            AuctionEngine& engine;
            Clock clock;

            std::mutex nonceMtx;
            std::unordered_map<Address, uint64_t> lastNonce;
    };

} // namespace gavel::net

#endif // GAVEL_NET_REQUEST_HANDLER_HPP
