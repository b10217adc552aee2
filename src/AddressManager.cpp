#include "gavel/AddressManager.hpp"
#include "gavel/Crypto.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gavel {

std::string AddressManager::getAddressFromPublicKey(const std::vector<uint8_t>& publicKey) {
    if (publicKey.size() != PUBLIC_KEY_SIZE) {
        throw std::invalid_argument("Invalid public key format");
    }

    std::vector<uint8_t> hash = Crypto::sha256Bytes(publicKey);

    // Tomar los últimos 20 bytes para la dirección (estilo Ethereum)
    std::vector<uint8_t> addressBytes(hash.end() - ADDRESS_SIZE, hash.end());

    return Crypto::hexEncode(addressBytes);
}

bool AddressManager::isValidAddress(const std::string& address) {
    if (address.length() != ADDRESS_HEX_LENGTH) {
        return false;
    }

    return std::all_of(address.begin(), address.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string AddressManager::normalizeAddress(const std::string& address) {
    if (!isValidAddress(address)) {
        throw std::invalid_argument("Cannot normalize invalid address: " + address);
    }

    std::string normalized = address;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return normalized;
}

} // namespace gavel
