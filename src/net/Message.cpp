#include "gavel/net/Message.hpp"
#include "gavel/Crypto.hpp"
#include "gavel/Errors.hpp"
#include "gavel/Serialization.hpp"
#include <iostream>
#include <stdexcept>

namespace gavel::net {

    // Tamaño fijo del sobre firmado sin cuerpo
    static constexpr size_t REQUEST_ENVELOPE_SIZE = PUBLIC_KEY_SIZE + 8 + SIGNATURE_SIZE;

    // ------------------------------------------------------------
    // SERIALIZACIÓN
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeMessage(const Message& message) {
        if (message.payload.size() > MAX_PAYLOAD_SIZE) {
            throw std::runtime_error("Payload too large: " + std::to_string(message.payload.size()));
        }

        ByteWriter writer;
        writer.writeU32(message.magic);
        writer.writeU8(message.version);
        writer.writeU8(static_cast<uint8_t>(message.type));
        writer.writeU64(message.payload.size());
        writer.writeRaw(message.payload);

        // checksum CRC32 sobre TODO lo anterior
        uint32_t checksum = crc32_buf(writer.data().data(), writer.data().size());
        writer.writeU32(checksum);

        return writer.take();
    }

    // ------------------------------------------------------------
    // PARSEO SOLO DE CABECERA
    // ------------------------------------------------------------
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuffer, Message& outputHeader, uint64_t& payloadLength) {
        if (headerBuffer.size() < MESSAGE_HEADER_SIZE) return false;

        size_t position = 0;
        outputHeader.magic = getU32(&headerBuffer[position]);
        position += 4;

        outputHeader.version = headerBuffer[position++];
        uint8_t rawType = headerBuffer[position++];

        payloadLength = getU64(&headerBuffer[position]);

        // Validaciones básicas
        if (outputHeader.magic != NETWORK_MAGIC) return false;
        if (outputHeader.version != PROTOCOL_VERSION) return false;
        if (!isValidRequestType(rawType)) return false;
        if (payloadLength > MAX_PAYLOAD_SIZE) return false;

        outputHeader.type = static_cast<RequestType>(rawType);
        return true;
    }

    // ------------------------------------------------------------
    // PARSEO COMPLETO (cabecera + payload + checksum)
    // ------------------------------------------------------------
    bool parseFullMessage(const std::vector<uint8_t>& buffer, Message& outputMessage) {
        if (buffer.size() < MESSAGE_HEADER_SIZE + CHECKSUM_SIZE) return false;

        // 1. Parsear cabecera
        Message header;
        uint64_t payloadLength;
        if (!parseMessageHeader(buffer, header, payloadLength)) return false;

        // 2. Verificar que tenemos el mensaje completo y nada más
        const size_t totalLength = MESSAGE_HEADER_SIZE + payloadLength + CHECKSUM_SIZE;
        if (buffer.size() != totalLength) return false;

        // 3. Extraer y validar CRC32
        uint32_t receivedChecksum = getU32(&buffer[MESSAGE_HEADER_SIZE + payloadLength]);

        uint32_t calculatedChecksum = crc32_buf(buffer.data(), MESSAGE_HEADER_SIZE + payloadLength);
        if (calculatedChecksum != receivedChecksum) return false; // corrupción

        // 4. Construir mensaje final
        outputMessage = header;
        outputMessage.payload.assign(
            buffer.begin() + MESSAGE_HEADER_SIZE,
            buffer.begin() + MESSAGE_HEADER_SIZE + payloadLength);

        return true;
    }

    // ------------------------------------------------------------
    // UTILIDAD: convertir RequestType a string
    // ------------------------------------------------------------
    std::string requestTypeToString(RequestType type) {
        switch (type) {
            case RequestType::CREATE_AUCTION:   return "CREATE_AUCTION";
            case RequestType::PLACE_BID:        return "PLACE_BID";
            case RequestType::END_AUCTION:      return "END_AUCTION";
            case RequestType::CANCEL_AUCTION:   return "CANCEL_AUCTION";
            case RequestType::WITHDRAW_FUNDS:   return "WITHDRAW_FUNDS";
            case RequestType::SET_EMERGENCY:    return "SET_EMERGENCY";
            case RequestType::SET_MAINTENANCE:  return "SET_MAINTENANCE";
            case RequestType::RECOVER_TOKEN:    return "RECOVER_TOKEN";
            case RequestType::BLACKLIST_BIDDER: return "BLACKLIST_BIDDER";
            case RequestType::UPDATE_FEE:       return "UPDATE_FEE";
            case RequestType::GRANT_ROLE:       return "GRANT_ROLE";
            case RequestType::REVOKE_ROLE:      return "REVOKE_ROLE";
            case RequestType::GET_AUCTION:      return "GET_AUCTION";
            case RequestType::GET_HIGHEST_BID:  return "GET_HIGHEST_BID";
            case RequestType::GET_BID_COUNT:    return "GET_BID_COUNT";
            case RequestType::GET_BID:          return "GET_BID";
            case RequestType::ESCROW_BALANCE:   return "ESCROW_BALANCE";
            case RequestType::GET_METRICS:      return "GET_METRICS";
            case RequestType::CHECK_RATE_LIMIT: return "CHECK_RATE_LIMIT";
            case RequestType::GET_EVENTS:       return "GET_EVENTS";
            case RequestType::RESPONSE:         return "RESPONSE";
            case RequestType::DISCONNECT:       return "DISCONNECT";
            default:                            return "UNKNOWN";
        }
    }

    bool isValidRequestType(uint8_t raw) {
        return (raw >= 1 && raw <= 12) || (raw >= 20 && raw <= 27) || raw == 128 || raw == 255;
    }

    // ------------------------------------------------------------
    // PETICIONES FIRMADAS
    // ------------------------------------------------------------
    std::vector<uint8_t> signingPayload(RequestType type, uint64_t nonce, const std::vector<uint8_t>& body) {
        ByteWriter writer;
        writer.writeU8(static_cast<uint8_t>(type));
        writer.writeU64(nonce);
        writer.writeRaw(body);
        return writer.take();
    }

    std::vector<uint8_t> encodeRequest(const SignedRequest& request) {
        if (request.publicKey.size() != PUBLIC_KEY_SIZE || request.signature.size() != SIGNATURE_SIZE) {
            throw std::invalid_argument("Invalid public key or signature size");
        }

        ByteWriter writer;
        writer.writeRaw(request.publicKey);
        writer.writeU64(request.nonce);
        writer.writeRaw(request.body);
        writer.writeRaw(request.signature);
        return writer.take();
    }

    bool decodeRequest(const std::vector<uint8_t>& payload, SignedRequest& out) {
        if (payload.size() < REQUEST_ENVELOPE_SIZE) {
            return false;
        }

        try {
            ByteReader reader(payload);
            SignedRequest request;
            request.publicKey = reader.readRaw(PUBLIC_KEY_SIZE);
            request.nonce = reader.readU64();
            request.body = reader.readRaw(reader.remaining() - SIGNATURE_SIZE);
            request.signature = reader.readRaw(SIGNATURE_SIZE);
            out = std::move(request);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Malformed request envelope: " << e.what() << std::endl;
            return false;
        }
    }

    Message makeSignedRequest(RequestType type, uint64_t nonce, const std::vector<uint8_t>& body,
                              const std::vector<uint8_t>& privateKey, const std::vector<uint8_t>& publicKey) {
        SignedRequest request;
        request.publicKey = publicKey;
        request.nonce = nonce;
        request.body = body;

        if (!Crypto::signMessage(privateKey, signingPayload(type, nonce, body), request.signature)) {
            throw std::runtime_error("Failed to sign " + requestTypeToString(type) + " request");
        }

        Message message;
        message.type = type;
        message.payload = encodeRequest(request);
        return message;
    }

    // ------------------------------------------------------------
    // RESPUESTAS
    // ------------------------------------------------------------
    std::vector<uint8_t> encodeResponse(const Response& response) {
        ByteWriter writer;
        writer.writeU8(response.status);
        writer.writeString(response.message);
        writer.writeRaw(response.result);
        return writer.take();
    }

    bool decodeResponse(const std::vector<uint8_t>& payload, Response& out) {
        try {
            ByteReader reader(payload);
            Response response;
            response.status = reader.readU8();
            if (response.status != STATUS_OK && response.status != STATUS_BAD_REQUEST &&
                !isValidErrorCode(response.status)) {
                return false;
            }
            response.message = reader.readString();
            response.result = reader.readRaw(reader.remaining());
            out = std::move(response);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Malformed response: " << e.what() << std::endl;
            return false;
        }
    }

    Message makeResponseMessage(const Response& response) {
        Message message;
        message.type = RequestType::RESPONSE;
        message.payload = encodeResponse(response);
        return message;
    }

} // namespace gavel::net
