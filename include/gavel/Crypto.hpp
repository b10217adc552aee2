#ifndef GAVEL_CRYPTO_HPP
#define GAVEL_CRYPTO_HPP

#include "gavel/Types.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace gavel {

/**
 * @class Crypto
 * @brief Hashing, codificación y firmas Ed25519 sobre libsodium.
 *
 * Sirve al registro de eventos (cadena de hashes), a la derivación de
 * direcciones de actores y a la autenticación de peticiones de red.
 */
class Crypto {
public:
    // Inicialización (una sola vez al inicio)
    static bool initialize();

    // Hashing
    static std::vector<uint8_t> sha256Bytes(const std::vector<uint8_t>& data);
    static std::string sha256Hex(const std::string& data);

    // Codificación
    static std::string hexEncode(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> hexDecode(const std::string& hexStr);

    // Claves y firmas
    static bool generateKeyPair(std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey);
    static bool signMessage(const std::vector<uint8_t>& privateKey,
                            const std::vector<uint8_t>& message,
                            std::vector<uint8_t>& signature);
    static bool verifySignature(const std::vector<uint8_t>& publicKey,
                                const std::vector<uint8_t>& message,
                                const std::vector<uint8_t>& signature);

    // Utilidades de seguridad
    static void secureClean(std::vector<uint8_t>& sensitiveData);
};

} // namespace gavel

#endif // GAVEL_CRYPTO_HPP
