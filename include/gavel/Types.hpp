#ifndef GAVEL_TYPES_HPP
#define GAVEL_TYPES_HPP

#include <cstdint>
#include <cstddef>

namespace gavel {

// -----------------------------------------------------------------------------------
// ---------------------------- Libsodium Types --------------------------------------
// -----------------------------------------------------------------------------------

// Constantes para Ed25519 (libsodium)
inline constexpr size_t PRIVATE_KEY_SIZE = 64;  // Clave privada completa de libsodium
inline constexpr size_t SEED_SIZE = 32;         // Semilla
inline constexpr size_t PUBLIC_KEY_SIZE = 32;   // Clave pública
inline constexpr size_t SIGNATURE_SIZE = 64;    // Tamaño de la firma Ed25519
inline constexpr size_t SHA256_HASH_SIZE = 32;  // Tamaño del hash SHA-256

// ==== CONSTANTES DE DIRECCIONES ====
inline constexpr size_t ADDRESS_SIZE = 20;       // 20 bytes = 160 bits
inline constexpr size_t ADDRESS_HEX_LENGTH = 40; // Dirección en hexadecimal

// ==== CONSTANTES DE SUBASTA ====
inline constexpr const char* NATIVE_ASSET = "native";   // Moneda nativa del motor
inline constexpr uint64_t ASSET_UNIT = 1;                // Un activo subastado = 1 unidad
inline constexpr uint64_t RATE_LIMIT_PERIOD = 3600;      // 1 hora
inline constexpr uint32_t MAX_ACTIONS_PER_PERIOD = 100;
inline constexpr uint64_t ACTION_COOLDOWN = 60;          // 1 minuto entre pujas
inline constexpr uint32_t MAX_FEE_BASIS_POINTS = 1000;   // 10%
inline constexpr uint32_t BASIS_POINTS_DENOMINATOR = 10000;

// ==== CONSTANTES DE SERIALIZACION ====
inline constexpr uint32_t SERIALIZATION_VERSION = 1;
inline constexpr uint32_t EVENT_MAGIC = 0x6A7E1E57;

// ============================================================
//  CONFIGURACIÓN DEL PROTOCOLO DE RED
// ============================================================

inline constexpr uint32_t NETWORK_MAGIC = 0x6A7E1B1D;
inline constexpr uint8_t PROTOCOL_VERSION = 1;

// Límites de tamaño
inline constexpr size_t MAX_PAYLOAD_SIZE = 1 * 1024 * 1024;       // 1 MB máximo
inline constexpr size_t MESSAGE_HEADER_SIZE = 4 + 1 + 1 + 8;      // magic + version + type + payload_len
inline constexpr size_t CHECKSUM_SIZE = 4;                        // CRC32
inline constexpr size_t MAX_STRING_FIELD = 64 * 1024;

// Límites de red
inline constexpr size_t MAX_CLIENTS = 256;
inline constexpr uint16_t DEFAULT_PORT = 30420;

} // namespace gavel

#endif // GAVEL_TYPES_HPP
