#ifndef GAVEL_IN_MEMORY_LEDGER_HPP
#define GAVEL_IN_MEMORY_LEDGER_HPP

#include "gavel/PaymentAdapter.hpp"
#include <istream>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace gavel {

    /**
     * PaymentAdapter over internal ledger entries: a balance per
     * (asset, account). The engine's own holdings sit under custodyAccount.
     * Thread safe.
     */
    class InMemoryLedger : public PaymentAdapter {
        public:
            explicit InMemoryLedger(const Address& custodyAccount);

            bool custody(const std::string& asset, const Address& from, Amount amount) override;
            bool release(const std::string& asset, const Address& to, Amount amount) override;
            bool pull(const std::string& paymentAsset, const Address& from, Amount amount) override;
            Amount balanceOf(const std::string& asset) const override;

            // Acredita saldo externo (mint); usado para fondear cuentas
            void deposit(const std::string& asset, const Address& account, Amount amount);

            /**
             * Reads starting balances, one "<asset> <address> <amount>" per
             * line; blank lines and lines starting with '#' are skipped.
             * Nothing is credited unless every line is valid. Throws
             * std::runtime_error naming the offending line. Returns the number
             * of entries credited.
             */
            size_t loadBalances(std::istream& in);

            Amount balance(const std::string& asset, const Address& account) const;
            const Address& custodyAccount() const { return engineAccount; }

        private:
            bool transfer(const std::string& asset, const Address& from, const Address& to, Amount amount);

            Address engineAccount;
            mutable std::mutex ledgerMtx;
            std::map<std::pair<std::string, Address>, Amount> balances;
    };

} // namespace gavel

#endif // GAVEL_IN_MEMORY_LEDGER_HPP
