#ifndef GAVEL_EVENT_LOG_HPP
#define GAVEL_EVENT_LOG_HPP

#include "gavel/Events.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace gavel {

    /**
     * Append-only audit stream. Each event is chained to the previous one by
     * SHA-256, like block headers reference their predecessor.
     *
     * Sealing and delivery are separate steps: append() fixes sequence and
     * hash and may run under the caller's locks; dispatch() runs subscribers
     * synchronously, in sequence order, and must run with no caller lock
     * held. A subscriber may call back into the engine.
     */
    class EventLog {
        public:
            using Subscriber = std::function<void(const Event&)>;

            EventLog() = default;

            /**
             * Assigns sequence numbers and hashes to the batch and appends it.
             * Subscribers are not called. Returns the sealed events.
             */
            std::vector<Event> append(std::vector<Event> batch);

            /**
             * Delivers every appended event not yet delivered, oldest first.
             * Whichever thread dispatches first also delivers events appended
             * by others.
             */
            void dispatch();

            // append() seguido de dispatch()
            std::vector<Event> publish(std::vector<Event> batch);

            uint64_t subscribe(Subscriber subscriber);
            bool unsubscribe(uint64_t subscriptionId);

            std::vector<Event> events() const;
            std::vector<Event> eventsSince(uint64_t sequence) const;
            size_t size() const;
            std::string lastHash() const;

            /**
             * Recomputes every hash and link. Returns false on the first mismatch.
             */
            bool verifyChain() const;

            static std::string computeHash(const Event& event);
            static const std::string& genesisHash();

        private:
            mutable std::mutex logMtx;
            std::recursive_mutex dispatchMtx;
            std::vector<Event> entries;
            size_t delivered = 0; // entradas ya entregadas a suscriptores
            std::map<uint64_t, Subscriber> subscribers;
            uint64_t nextSubscriptionId = 1;
    };

} // namespace gavel

#endif // GAVEL_EVENT_LOG_HPP
