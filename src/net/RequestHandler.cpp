#include "gavel/net/RequestHandler.hpp"
#include "gavel/AddressManager.hpp"
#include "gavel/Crypto.hpp"
#include "gavel/Errors.hpp"
#include "gavel/EventCodec.hpp"
#include "gavel/Serialization.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace gavel::net {

    namespace {

        constexpr size_t MAX_EVENTS_PER_RESPONSE = 1000;

        const std::string OK_MESSAGE = "OK";

        // status(1) + mensaje prefijado + contador de eventos(4)
        const size_t EVENT_PAGE_OVERHEAD = 1 + 4 + OK_MESSAGE.size() + 4;

        Response badRequest(const std::string& reason) {
            Response response;
            response.status = STATUS_BAD_REQUEST;
            response.message = reason;
            return response;
        }

        Role readRole(ByteReader& reader) {
            uint8_t raw = reader.readU8();
            if (raw < static_cast<uint8_t>(Role::Admin) || raw > static_cast<uint8_t>(Role::Recovery)) {
                throw std::runtime_error("Unknown role " + std::to_string(raw));
            }
            return static_cast<Role>(raw);
        }

        /**
         * Takes events in order while the response payload stays within
         * MAX_PAYLOAD_SIZE. The client continues from the last sequence.
         */
        std::vector<uint8_t> eventPage(const std::vector<Event>& events) {
            std::vector<Event> page;
            size_t used = EVENT_PAGE_OVERHEAD;

            for (const auto& event : events) {
                if (page.size() == MAX_EVENTS_PER_RESPONSE) break;

                // Registro prefijado por su longitud (4)
                size_t cost = 4 + serializeEvent(event).size();
                if (used + cost > MAX_PAYLOAD_SIZE) break;

                used += cost;
                page.push_back(event);
            }

            return serializeEvents(page);
        }

        void requireEnd(const ByteReader& reader) {
            if (!reader.atEnd()) {
                throw std::runtime_error("Trailing bytes in request body");
            }
        }

    } // namespace

    RequestHandler::RequestHandler(AuctionEngine& engine, Clock clock)
        : engine(engine), clock(std::move(clock)) {
        if (!this->clock) {
            throw std::invalid_argument("Request handler needs a clock");
        }
    }

    Timestamp RequestHandler::systemClock() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    bool RequestHandler::acceptNonce(const Address& caller, uint64_t nonce) {
        std::lock_guard<std::mutex> lock(nonceMtx);
        auto it = lastNonce.find(caller);
        if (it != lastNonce.end() && nonce <= it->second) {
            return false;
        }
        lastNonce[caller] = nonce;
        return true;
    }

    Message RequestHandler::handle(const Message& request) {
        if (request.type == RequestType::RESPONSE || request.type == RequestType::DISCONNECT) {
            return makeResponseMessage(badRequest("not a request: " + requestTypeToString(request.type)));
        }

        SignedRequest signedRequest;
        if (!decodeRequest(request.payload, signedRequest)) {
            return makeResponseMessage(badRequest("malformed request envelope"));
        }

        std::vector<uint8_t> signedBytes = signingPayload(request.type, signedRequest.nonce, signedRequest.body);
        if (!Crypto::verifySignature(signedRequest.publicKey, signedBytes, signedRequest.signature)) {
            std::cerr << "Warning: Invalid signature on " << requestTypeToString(request.type) << " request" << std::endl;
            return makeResponseMessage(badRequest("invalid signature"));
        }

        CallContext ctx;
        ctx.caller = AddressManager::getAddressFromPublicKey(signedRequest.publicKey);
        ctx.now = clock();

        if (!acceptNonce(ctx.caller, signedRequest.nonce)) {
            std::cerr << "Warning: Replayed nonce " << signedRequest.nonce << " from " << ctx.caller << std::endl;
            Response response;
            response.status = static_cast<uint8_t>(ErrorCode::Unauthorized);
            response.message = "replayed nonce";
            return makeResponseMessage(response);
        }

        Response response;
        try {
            response = dispatch(request.type, ctx, signedRequest.body);
        } catch (const AuctionError& e) {
            response = Response();
            response.status = static_cast<uint8_t>(e.code());
            response.message = e.what();
        } catch (const std::exception& e) {
            std::cerr << "Warning: Bad " << requestTypeToString(request.type) << " request from "
                      << ctx.caller << ": " << e.what() << std::endl;
            response = badRequest(e.what());
        }

        return makeResponseMessage(response);
    }

    Response RequestHandler::dispatch(RequestType type, const CallContext& ctx, const std::vector<uint8_t>& body) {
        ByteReader reader(body);
        ByteWriter result;

        switch (type) {
            case RequestType::CREATE_AUCTION: {
                AuctionParams params;
                params.asset = reader.readString();
                params.paymentAsset = reader.readString();
                params.reservePrice = reader.readU64();
                params.buyNowPrice = reader.readU64();
                params.minimumBidIncrement = reader.readU64();
                params.durationSeconds = reader.readU64();
                params.timeExtensionSeconds = reader.readU64();
                params.extensionWindowSeconds = reader.readU64();
                requireEnd(reader);
                result.writeU64(engine.createAuction(ctx, params));
                break;
            }
            case RequestType::PLACE_BID: {
                AuctionId id = reader.readU64();
                Amount amount = reader.readU64();
                PaymentProof proof;
                proof.attachedValue = reader.readU64();
                proof.reference = reader.readString();
                requireEnd(reader);
                engine.placeBid(ctx, id, amount, proof);
                break;
            }
            case RequestType::END_AUCTION: {
                AuctionId id = reader.readU64();
                requireEnd(reader);
                engine.endAuction(ctx, id);
                break;
            }
            case RequestType::CANCEL_AUCTION: {
                AuctionId id = reader.readU64();
                requireEnd(reader);
                engine.cancelAuction(ctx, id);
                break;
            }
            case RequestType::WITHDRAW_FUNDS: {
                AuctionId id = reader.readU64();
                requireEnd(reader);
                result.writeU64(engine.withdrawFunds(ctx, id));
                break;
            }
            case RequestType::SET_EMERGENCY: {
                bool enabled = reader.readBool();
                requireEnd(reader);
                engine.setEmergencyState(ctx, enabled);
                break;
            }
            case RequestType::SET_MAINTENANCE: {
                bool enabled = reader.readBool();
                requireEnd(reader);
                engine.setMaintenanceMode(ctx, enabled);
                break;
            }
            case RequestType::RECOVER_TOKEN: {
                std::string asset = reader.readString();
                Amount amount = reader.readU64();
                requireEnd(reader);
                engine.recoverToken(ctx, asset, amount);
                break;
            }
            case RequestType::BLACKLIST_BIDDER: {
                Address bidder = reader.readString();
                bool blacklisted = reader.readBool();
                requireEnd(reader);
                engine.blacklistBidder(ctx, bidder, blacklisted);
                break;
            }
            case RequestType::UPDATE_FEE: {
                uint32_t fee = reader.readU32();
                requireEnd(reader);
                engine.updatePlatformFee(ctx, fee);
                break;
            }
            case RequestType::GRANT_ROLE:
            case RequestType::REVOKE_ROLE: {
                Address actor = reader.readString();
                Role role = readRole(reader);
                requireEnd(reader);
                if (type == RequestType::GRANT_ROLE) {
                    engine.grantRole(ctx, actor, role);
                } else {
                    engine.revokeRole(ctx, actor, role);
                }
                break;
            }
            case RequestType::GET_AUCTION: {
                AuctionId id = reader.readU64();
                requireEnd(reader);
                AuctionItem item = engine.getAuction(id);
                result.writeU64(item.id);
                result.writeString(item.asset);
                result.writeString(item.paymentAsset);
                result.writeU64(item.reservePrice);
                result.writeU64(item.buyNowPrice);
                result.writeU64(item.minimumBidIncrement);
                result.writeU64(item.timeExtensionSeconds);
                result.writeU64(item.extensionWindowSeconds);
                result.writeString(item.owner);
                result.writeBool(item.isActive);
                result.writeBool(item.isCanceled);
                result.writeU64(item.startTime);
                result.writeU64(item.endTime);
                break;
            }
            case RequestType::GET_HIGHEST_BID: {
                AuctionId id = reader.readU64();
                requireEnd(reader);
                HighestBid highest = engine.getHighestBid(id);
                result.writeString(highest.bidder);
                result.writeU64(highest.amount);
                break;
            }
            case RequestType::GET_BID_COUNT: {
                AuctionId id = reader.readU64();
                requireEnd(reader);
                result.writeU64(engine.getBidCount(id));
                break;
            }
            case RequestType::GET_BID: {
                AuctionId id = reader.readU64();
                uint64_t index = reader.readU64();
                requireEnd(reader);
                Bid bid = engine.getBid(id, static_cast<size_t>(index));
                result.writeString(bid.bidder);
                result.writeU64(bid.amount);
                result.writeU64(bid.timestamp);
                result.writeBool(bid.withdrawn);
                break;
            }
            case RequestType::ESCROW_BALANCE: {
                AuctionId id = reader.readU64();
                Address bidder = reader.readString();
                requireEnd(reader);
                result.writeU64(engine.escrowBalance(id, bidder));
                break;
            }
            case RequestType::GET_METRICS: {
                requireEnd(reader);
                SystemMetrics metrics = engine.getSystemMetrics();
                result.writeU64(metrics.totalAuctions);
                result.writeU64(metrics.activeAuctions);
                result.writeU64(metrics.totalVolume);
                result.writeU64(metrics.lastUpdateTimestamp);
                break;
            }
            case RequestType::CHECK_RATE_LIMIT: {
                Address actor = reader.readString();
                requireEnd(reader);
                RateLimitStatus status = engine.checkRateLimit(actor, ctx.now);
                result.writeU32(status.actionsRemaining);
                result.writeU64(status.cooldownEnds);
                break;
            }
            case RequestType::GET_EVENTS: {
                uint64_t since = reader.readU64();
                requireEnd(reader);
                result.writeRaw(eventPage(engine.events().eventsSince(since)));
                break;
            }
            default:
                return badRequest("unsupported request type " + requestTypeToString(type));
        }

        Response response;
        response.status = STATUS_OK;
        response.message = OK_MESSAGE;
        response.result = result.take();
        return response;
    }

} // namespace gavel::net
