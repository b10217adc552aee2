#include "gavel/Serialization.hpp"
#include "gavel/Types.hpp"
#include <stdexcept>
#include <zlib.h>      // crc32

namespace gavel {

    // ------------------------------------------------------------
    // Enteros big-endian
    // ------------------------------------------------------------
    void putU32(uint8_t* out, uint32_t value) {
        for (int i = 3; i >= 0; --i) {
            out[i] = static_cast<uint8_t>(value & 0xFF);
            value >>= 8;
        }
    }

    void putU64(uint8_t* out, uint64_t value) {
        for (int i = 7; i >= 0; --i) {
            out[i] = static_cast<uint8_t>(value & 0xFF);
            value >>= 8;
        }
    }

    uint32_t getU32(const uint8_t* in) {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | in[i];
        }
        return value;
    }

    uint64_t getU64(const uint8_t* in) {
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | in[i];
        }
        return value;
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    // ------------------------------------------------------------
    // ESCRITURA
    // ------------------------------------------------------------
    void ByteWriter::writeU8(uint8_t value) {
        buffer.push_back(value);
    }

    void ByteWriter::writeU32(uint32_t value) {
        uint8_t bytes[4];
        putU32(bytes, value);
        buffer.insert(buffer.end(), bytes, bytes + 4);
    }

    void ByteWriter::writeU64(uint64_t value) {
        uint8_t bytes[8];
        putU64(bytes, value);
        buffer.insert(buffer.end(), bytes, bytes + 8);
    }

    void ByteWriter::writeBool(bool value) {
        buffer.push_back(value ? 1 : 0);
    }

    void ByteWriter::writeString(const std::string& str) {
        if (str.size() > MAX_STRING_FIELD) {
            throw std::runtime_error("String field too large: " + std::to_string(str.size()));
        }
        writeU32(static_cast<uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void ByteWriter::writeRaw(const std::vector<uint8_t>& data) {
        buffer.insert(buffer.end(), data.begin(), data.end());
    }

    // ------------------------------------------------------------
    // LECTURA
    // ------------------------------------------------------------
    ByteReader::ByteReader(const std::vector<uint8_t>& data, size_t offset)
        : buf(data), pos(offset) {
        if (offset > data.size()) {
            throw std::runtime_error("Reader offset beyond buffer");
        }
    }

    void ByteReader::require(size_t count) const {
        if (count > buf.size() - pos) {
            throw std::runtime_error("Unexpected end of data: need " + std::to_string(count) +
                                     " bytes, have " + std::to_string(buf.size() - pos));
        }
    }

    uint8_t ByteReader::readU8() {
        require(1);
        return buf[pos++];
    }

    uint32_t ByteReader::readU32() {
        require(4);
        uint32_t value = getU32(&buf[pos]);
        pos += 4;
        return value;
    }

    uint64_t ByteReader::readU64() {
        require(8);
        uint64_t value = getU64(&buf[pos]);
        pos += 8;
        return value;
    }

    bool ByteReader::readBool() {
        uint8_t raw = readU8();
        if (raw > 1) {
            throw std::runtime_error("Invalid boolean byte: " + std::to_string(raw));
        }
        return raw == 1;
    }

    std::string ByteReader::readString() {
        uint32_t size = readU32();
        if (size > MAX_STRING_FIELD) {
            throw std::runtime_error("String size too large: " + std::to_string(size));
        }
        require(size);
        std::string str(buf.begin() + pos, buf.begin() + pos + size);
        pos += size;
        return str;
    }

    std::vector<uint8_t> ByteReader::readRaw(size_t count) {
        require(count);
        std::vector<uint8_t> out(buf.begin() + pos, buf.begin() + pos + count);
        pos += count;
        return out;
    }

} // namespace gavel
