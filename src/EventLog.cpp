#include "gavel/EventLog.hpp"
#include "gavel/Crypto.hpp"
#include <iostream>

namespace gavel {

    const std::string& EventLog::genesisHash() {
        static const std::string genesis(SHA256_HASH_SIZE * 2, '0');
        return genesis;
    }

    std::string EventLog::computeHash(const Event& event) {
        return Crypto::sha256Hex(event.stringForHash());
    }

    std::vector<Event> EventLog::append(std::vector<Event> batch) {
        if (batch.empty()) {
            return batch;
        }

        std::lock_guard<std::mutex> lock(logMtx);

        std::string previous = entries.empty() ? genesisHash() : entries.back().hash;
        uint64_t sequence = entries.empty() ? 1 : entries.back().sequence + 1;

        for (auto& event : batch) {
            event.sequence = sequence++;
            event.previousHash = previous;
            event.hash = computeHash(event);
            previous = event.hash;
            entries.push_back(event);
        }

        return batch;
    }

    void EventLog::dispatch() {
        // Serializa las entregas para que los suscriptores vean el orden de secuencia
        std::lock_guard<std::recursive_mutex> dispatchLock(dispatchMtx);

        while (true) {
            Event event;
            std::vector<Subscriber> targets;
            {
                std::lock_guard<std::mutex> lock(logMtx);
                if (delivered >= entries.size()) {
                    return;
                }
                event = entries[delivered++];

                targets.reserve(subscribers.size());
                for (const auto& [id, subscriber] : subscribers) {
                    targets.push_back(subscriber);
                }
            }

            for (const auto& subscriber : targets) {
                try {
                    subscriber(event);
                } catch (const std::exception& e) {
                    std::cerr << "Error in event subscriber (" << eventTypeToString(event.type)
                              << " #" << event.sequence << "): " << e.what() << std::endl;
                }
            }
        }
    }

    std::vector<Event> EventLog::publish(std::vector<Event> batch) {
        std::vector<Event> sealed = append(std::move(batch));
        dispatch();
        return sealed;
    }

    uint64_t EventLog::subscribe(Subscriber subscriber) {
        std::lock_guard<std::mutex> lock(logMtx);
        uint64_t id = nextSubscriptionId++;
        subscribers[id] = std::move(subscriber);
        return id;
    }

    bool EventLog::unsubscribe(uint64_t subscriptionId) {
        std::lock_guard<std::mutex> lock(logMtx);
        return subscribers.erase(subscriptionId) > 0;
    }

    std::vector<Event> EventLog::events() const {
        std::lock_guard<std::mutex> lock(logMtx);
        return entries;
    }

    std::vector<Event> EventLog::eventsSince(uint64_t sequence) const {
        std::lock_guard<std::mutex> lock(logMtx);

        std::vector<Event> result;
        for (const auto& event : entries) {
            if (event.sequence > sequence) {
                result.push_back(event);
            }
        }
        return result;
    }

    size_t EventLog::size() const {
        std::lock_guard<std::mutex> lock(logMtx);
        return entries.size();
    }

    std::string EventLog::lastHash() const {
        std::lock_guard<std::mutex> lock(logMtx);
        return entries.empty() ? genesisHash() : entries.back().hash;
    }

    bool EventLog::verifyChain() const {
        std::lock_guard<std::mutex> lock(logMtx);

        std::string previous = genesisHash();
        uint64_t expectedSequence = 1;

        for (const auto& event : entries) {
            if (event.sequence != expectedSequence) {
                std::cerr << "Error: Event sequence gap at " << expectedSequence << std::endl;
                return false;
            }
            if (event.previousHash != previous) {
                std::cerr << "Error: Event " << event.sequence << " has incorrect previous hash" << std::endl;
                return false;
            }
            if (computeHash(event) != event.hash) {
                std::cerr << "Error: Event " << event.sequence << " hash mismatch" << std::endl;
                return false;
            }
            previous = event.hash;
            expectedSequence++;
        }

        return true;
    }

} // namespace gavel
