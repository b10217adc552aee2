#ifndef GAVEL_EVENT_CODEC_HPP
#define GAVEL_EVENT_CODEC_HPP

#include "gavel/Events.hpp"
#include <cstdint>
#include <vector>

namespace gavel {

    /**
     * Binary record: magic, version, event fields (big-endian, strings length
     * prefixed), trailing CRC32 over everything before it.
     */
    std::vector<uint8_t> serializeEvent(const Event& event);

    /** Returns false on bad magic, version, checksum or truncated data. */
    bool parseEvent(const std::vector<uint8_t>& data, Event& out);

    /** Count-prefixed sequence of length-prefixed event records. */
    std::vector<uint8_t> serializeEvents(const std::vector<Event>& events);
    bool parseEvents(const std::vector<uint8_t>& data, std::vector<Event>& out);

} // namespace gavel

#endif // GAVEL_EVENT_CODEC_HPP
