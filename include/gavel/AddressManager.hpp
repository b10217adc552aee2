#ifndef GAVEL_ADDRESS_MANAGER_HPP
#define GAVEL_ADDRESS_MANAGER_HPP

#include "gavel/Types.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace gavel {

// Direcciones de actores: últimos 20 bytes de SHA-256(clave pública), en hex
class AddressManager {
public:
    static std::string getAddressFromPublicKey(const std::vector<uint8_t>& publicKey);

    static bool isValidAddress(const std::string& address);

    // Minúsculas; lanza std::invalid_argument si la dirección no es válida
    static std::string normalizeAddress(const std::string& address);
};

} // namespace gavel

#endif // GAVEL_ADDRESS_MANAGER_HPP
