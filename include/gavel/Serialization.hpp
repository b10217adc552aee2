#ifndef GAVEL_SERIALIZATION_HPP
#define GAVEL_SERIALIZATION_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gavel {

    // Big-endian por desplazamientos, independiente del host
    void putU32(uint8_t* out, uint32_t value);
    void putU64(uint8_t* out, uint64_t value);
    uint32_t getU32(const uint8_t* in);
    uint64_t getU64(const uint8_t* in);

    /** Calcula el CRC32 (zlib) de un buffer */
    uint32_t crc32_buf(const void* data, size_t len);

    // Escritura big-endian con cadenas prefijadas por longitud
    class ByteWriter {
    public:
        void writeU8(uint8_t value);
        void writeU32(uint32_t value);
        void writeU64(uint64_t value);
        void writeBool(bool value);
        void writeString(const std::string& str);
        void writeRaw(const std::vector<uint8_t>& data);

        const std::vector<uint8_t>& data() const { return buffer; }
        std::vector<uint8_t> take() { return std::move(buffer); }

    private:
        std::vector<uint8_t> buffer;
    };

    // Lectura; lanza std::runtime_error si los datos se acaban o son demasiado grandes
    class ByteReader {
    public:
        explicit ByteReader(const std::vector<uint8_t>& data, size_t offset = 0);

        uint8_t readU8();
        uint32_t readU32();
        uint64_t readU64();
        bool readBool();
        std::string readString();
        std::vector<uint8_t> readRaw(size_t count);

        size_t position() const { return pos; }
        size_t remaining() const { return buf.size() - pos; }
        bool atEnd() const { return pos == buf.size(); }

    private:
        void require(size_t count) const;

        const std::vector<uint8_t>& buf;
        size_t pos;
    };

} // namespace gavel

#endif // GAVEL_SERIALIZATION_HPP
