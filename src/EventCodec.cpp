#include "gavel/EventCodec.hpp"
#include "gavel/Serialization.hpp"
#include "gavel/Types.hpp"
#include <iostream>
#include <stdexcept>

namespace gavel {

    // Límite de eventos por lote deserializado
    static constexpr uint32_t MAX_EVENTS_PER_BATCH = 100000;

    std::vector<uint8_t> serializeEvent(const Event& event) {
        ByteWriter writer;

        // Cabecera de serialización
        writer.writeU32(EVENT_MAGIC);
        writer.writeU32(SERIALIZATION_VERSION);

        writer.writeU64(event.sequence);
        writer.writeU8(static_cast<uint8_t>(event.type));
        writer.writeU64(event.auctionId);
        writer.writeString(event.actor);
        writer.writeU64(event.amount);
        writer.writeU64(event.value);
        writer.writeU64(event.timestamp);
        writer.writeString(event.detail);
        writer.writeString(event.previousHash);
        writer.writeString(event.hash);

        // checksum CRC32 sobre TODO lo anterior
        uint32_t checksum = crc32_buf(writer.data().data(), writer.data().size());
        writer.writeU32(checksum);

        return writer.take();
    }

    bool parseEvent(const std::vector<uint8_t>& data, Event& out) {
        if (data.size() < 8 + CHECKSUM_SIZE) {
            return false;
        }

        try {
            ByteReader reader(data);

            if (reader.readU32() != EVENT_MAGIC) {
                std::cerr << "Warning: Invalid event magic" << std::endl;
                return false;
            }

            uint32_t version = reader.readU32();
            if (version != SERIALIZATION_VERSION) {
                std::cerr << "Warning: Unsupported event serialization version: " << version << std::endl;
                return false;
            }

            Event event;
            event.sequence = reader.readU64();

            uint8_t rawType = reader.readU8();
            if (!isValidEventType(rawType)) {
                std::cerr << "Warning: Unknown event type: " << static_cast<int>(rawType) << std::endl;
                return false;
            }
            event.type = static_cast<EventType>(rawType);

            event.auctionId = reader.readU64();
            event.actor = reader.readString();
            event.amount = reader.readU64();
            event.value = reader.readU64();
            event.timestamp = reader.readU64();
            event.detail = reader.readString();
            event.previousHash = reader.readString();
            event.hash = reader.readString();

            size_t checkedLength = reader.position();
            uint32_t storedChecksum = reader.readU32();

            if (!reader.atEnd()) {
                std::cerr << "Warning: Trailing bytes after event record" << std::endl;
                return false;
            }

            if (crc32_buf(data.data(), checkedLength) != storedChecksum) {
                std::cerr << "Warning: Event checksum verification failed" << std::endl;
                return false;
            }

            out = event;
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error deserializing event: " << e.what() << std::endl;
            return false;
        }
    }

    std::vector<uint8_t> serializeEvents(const std::vector<Event>& events) {
        ByteWriter writer;
        writer.writeU32(static_cast<uint32_t>(events.size()));
        for (const auto& event : events) {
            std::vector<uint8_t> record = serializeEvent(event);
            writer.writeU32(static_cast<uint32_t>(record.size()));
            writer.writeRaw(record);
        }
        return writer.take();
    }

    bool parseEvents(const std::vector<uint8_t>& data, std::vector<Event>& out) {
        try {
            ByteReader reader(data);
            uint32_t count = reader.readU32();
            if (count > MAX_EVENTS_PER_BATCH) {
                std::cerr << "Error: Event batch too large: " << count << std::endl;
                return false;
            }

            std::vector<Event> parsed;
            parsed.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                uint32_t length = reader.readU32();
                std::vector<uint8_t> record = reader.readRaw(length);

                Event event;
                if (!parseEvent(record, event)) {
                    std::cerr << "Error: Failed to parse event " << i << " of batch" << std::endl;
                    return false;
                }
                parsed.push_back(std::move(event));
            }

            if (!reader.atEnd()) {
                return false;
            }

            out = std::move(parsed);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error deserializing event batch: " << e.what() << std::endl;
            return false;
        }
    }

} // namespace gavel
