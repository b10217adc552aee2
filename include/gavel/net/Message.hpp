#ifndef GAVEL_NET_MESSAGE_HPP
#define GAVEL_NET_MESSAGE_HPP

#include "gavel/Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gavel::net {

    // ============================================================
    //  TIPOS DE MENSAJE
    // ============================================================
    enum class RequestType : uint8_t {
        CREATE_AUCTION   = 1,
        PLACE_BID        = 2,
        END_AUCTION      = 3,
        CANCEL_AUCTION   = 4,
        WITHDRAW_FUNDS   = 5,
        SET_EMERGENCY    = 6,
        SET_MAINTENANCE  = 7,
        RECOVER_TOKEN    = 8,
        BLACKLIST_BIDDER = 9,
        UPDATE_FEE       = 10,
        GRANT_ROLE       = 11,
        REVOKE_ROLE      = 12,

        GET_AUCTION      = 20,
        GET_HIGHEST_BID  = 21,
        GET_BID_COUNT    = 22,
        GET_BID          = 23,
        ESCROW_BALANCE   = 24,
        GET_METRICS      = 25,
        CHECK_RATE_LIMIT = 26,
        GET_EVENTS       = 27,

        RESPONSE         = 128,
        DISCONNECT       = 255
    };

    // Estado de respuesta: 0 OK, 1..14 ErrorCode, 0xFF petición mal formada
    inline constexpr uint8_t STATUS_OK = 0;
    inline constexpr uint8_t STATUS_BAD_REQUEST = 0xFF;

    // ============================================================
    //  ESTRUCTURA DEL MENSAJE
    // ============================================================
    struct Message {
        uint32_t magic   = NETWORK_MAGIC;
        uint8_t  version = PROTOCOL_VERSION;
        RequestType type = RequestType::RESPONSE;
        std::vector<uint8_t> payload; // datos binarios
    };

    // Petición firmada: [pubkey(32)] [nonce(8)] [body] [firma(64)]
    struct SignedRequest {
        std::vector<uint8_t> publicKey;
        uint64_t nonce = 0;
        std::vector<uint8_t> body;
        std::vector<uint8_t> signature;
    };

    // Respuesta: [status(1)] [mensaje] [resultado]
    struct Response {
        uint8_t status = STATUS_OK;
        std::string message;
        std::vector<uint8_t> result;
    };

    // ============================================================
    //  FUNCIONES
    // ============================================================

    /** Serializa un Message a bytes en formato de red:
     * [magic(4) big-endian] [version(1)] [type(1)] [payload_len(8) big-endian]
     * [payload] [crc32(4)]
     */
    std::vector<uint8_t> serializeMessage(const Message& msg);

    /** Parsea SOLO la cabecera para obtener magic, versión, tipo y tamaño del payload.
     * Devuelve false si no hay bytes suficientes o si algún campo no es válido.
     */
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuf, Message& outHeader, uint64_t& payloadLen);

    /** Parsea un mensaje COMPLETO (cabecera + payload + checksum).
     * Devuelve false si faltan datos o si el mensaje es inválido.
     */
    bool parseFullMessage(const std::vector<uint8_t>& buf, Message& outMsg);

    /** Convierte un RequestType en string (útil para logs) */
    std::string requestTypeToString(RequestType t);

    bool isValidRequestType(uint8_t raw);

    // Bytes que cubre la firma: type || nonce(8, big-endian) || body
    std::vector<uint8_t> signingPayload(RequestType type, uint64_t nonce, const std::vector<uint8_t>& body);

    std::vector<uint8_t> encodeRequest(const SignedRequest& request);
    bool decodeRequest(const std::vector<uint8_t>& payload, SignedRequest& out);

    /**
     * Builds a request message signed with the given Ed25519 key pair.
     * Throws std::runtime_error if signing fails.
     */
    Message makeSignedRequest(RequestType type, uint64_t nonce, const std::vector<uint8_t>& body,
                              const std::vector<uint8_t>& privateKey, const std::vector<uint8_t>& publicKey);

    std::vector<uint8_t> encodeResponse(const Response& response);
    bool decodeResponse(const std::vector<uint8_t>& payload, Response& out);

    Message makeResponseMessage(const Response& response);

} // namespace gavel::net

#endif // GAVEL_NET_MESSAGE_HPP
