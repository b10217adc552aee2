#include "gavel/Crypto.hpp"
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace gavel {

namespace {
    // Función helper para validar caracteres hexadecimales
    bool isValidHexChar(char c) {
        return (c >= '0' && c <= '9') ||
               (c >= 'a' && c <= 'f') ||
               (c >= 'A' && c <= 'F');
    }
}

bool Crypto::initialize() {
    if (sodium_init() < 0) {
        std::cerr << "ERROR: Failed to initialize libsodium" << std::endl;
        return false;
    }

    return true;
}

std::vector<uint8_t> Crypto::sha256Bytes(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(crypto_hash_sha256_BYTES);

    // crypto_hash_sha256 puede manejar data.data() incluso cuando data.size() es 0
    if (crypto_hash_sha256(hash.data(), data.data(), data.size()) != 0) {
        throw std::runtime_error("SHA-256 computation failed");
    }

    return hash;
}

std::string Crypto::sha256Hex(const std::string& data) {
    std::vector<uint8_t> dataVec(data.begin(), data.end());
    return hexEncode(sha256Bytes(dataVec));
}

std::string Crypto::hexEncode(const std::vector<uint8_t>& data) {
    std::stringstream hexStream;
    hexStream << std::hex << std::setfill('0');

    for (uint8_t byte : data) {
        hexStream << std::setw(2) << static_cast<int>(byte);
    }

    return hexStream.str();
}

std::vector<uint8_t> Crypto::hexDecode(const std::string& hexStr) {
    if (hexStr.empty()) {
        return {};
    }

    if (hexStr.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    for (char c : hexStr) {
        if (!isValidHexChar(c)) {
            throw std::invalid_argument("Invalid hex character: " + std::string(1, c));
        }
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hexStr.length() / 2);

    for (size_t i = 0; i < hexStr.length(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(std::stoul(hexStr.substr(i, 2), nullptr, 16)));
    }

    return bytes;
}

bool Crypto::generateKeyPair(std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey) {
    privateKey.resize(PRIVATE_KEY_SIZE);
    publicKey.resize(PUBLIC_KEY_SIZE);

    std::vector<uint8_t> seed(SEED_SIZE);
    randombytes_buf(seed.data(), seed.size());

    int result = crypto_sign_ed25519_seed_keypair(publicKey.data(), privateKey.data(), seed.data());
    secureClean(seed);

    if (result != 0) {
        std::cerr << "Error: crypto_sign_ed25519_seed_keypair failed" << std::endl;
        secureClean(privateKey);
        secureClean(publicKey);
        return false;
    }

    return true;
}

bool Crypto::signMessage(const std::vector<uint8_t>& privateKey,
                         const std::vector<uint8_t>& message,
                         std::vector<uint8_t>& signature) {
    if (privateKey.size() != PRIVATE_KEY_SIZE) {
        std::cerr << "Error: Invalid private key size for signing: " << privateKey.size()
                  << " (expected: " << PRIVATE_KEY_SIZE << ")" << std::endl;
        return false;
    }

    if (message.empty()) {
        std::cerr << "Error: Cannot sign empty message" << std::endl;
        return false;
    }

    signature.assign(SIGNATURE_SIZE, 0);

    int result = crypto_sign_detached(signature.data(), nullptr,
                                      message.data(), message.size(),
                                      privateKey.data());
    if (result != 0) {
        std::cerr << "Error: crypto_sign_detached failed with code: " << result << std::endl;
        secureClean(signature);
        return false;
    }

    return true;
}

bool Crypto::verifySignature(const std::vector<uint8_t>& publicKey,
                             const std::vector<uint8_t>& message,
                             const std::vector<uint8_t>& signature) {
    if (publicKey.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) {
        return false;
    }

    if (message.empty()) {
        return false;
    }

    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       publicKey.data()) == 0;
}

void Crypto::secureClean(std::vector<uint8_t>& sensitiveData) {
    if (!sensitiveData.empty()) {
        sodium_memzero(sensitiveData.data(), sensitiveData.size());
    }
}

} // namespace gavel
