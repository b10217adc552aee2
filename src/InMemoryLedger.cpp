#include "gavel/InMemoryLedger.hpp"
#include "gavel/AddressManager.hpp"
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace gavel {

    InMemoryLedger::InMemoryLedger(const Address& custodyAccount)
        : engineAccount(custodyAccount) {
        if (custodyAccount.empty()) {
            throw std::invalid_argument("Custody account cannot be empty");
        }
    }

    bool InMemoryLedger::transfer(const std::string& asset, const Address& from,
                                  const Address& to, Amount amount) {
        if (asset.empty() || from.empty() || to.empty() || amount == 0) {
            return false;
        }

        std::lock_guard<std::mutex> lock(ledgerMtx);

        auto fromIt = balances.find({asset, from});
        if (fromIt == balances.end() || fromIt->second < amount) {
            std::cerr << "Warning: Insufficient " << asset << " balance for " << from
                      << " (requested " << amount << ")" << std::endl;
            return false;
        }

        Amount& target = balances[{asset, to}];
        if (from != to && target > std::numeric_limits<Amount>::max() - amount) {
            return false;
        }

        fromIt->second -= amount;
        target += amount;
        return true;
    }

    bool InMemoryLedger::custody(const std::string& asset, const Address& from, Amount amount) {
        return transfer(asset, from, engineAccount, amount);
    }

    bool InMemoryLedger::release(const std::string& asset, const Address& to, Amount amount) {
        return transfer(asset, engineAccount, to, amount);
    }

    bool InMemoryLedger::pull(const std::string& paymentAsset, const Address& from, Amount amount) {
        return transfer(paymentAsset, from, engineAccount, amount);
    }

    Amount InMemoryLedger::balanceOf(const std::string& asset) const {
        return balance(asset, engineAccount);
    }

    void InMemoryLedger::deposit(const std::string& asset, const Address& account, Amount amount) {
        std::lock_guard<std::mutex> lock(ledgerMtx);

        Amount& target = balances[{asset, account}];
        if (target > std::numeric_limits<Amount>::max() - amount) {
            throw std::overflow_error("Deposit overflows balance of " + account);
        }
        target += amount;
    }

    size_t InMemoryLedger::loadBalances(std::istream& in) {
        std::vector<std::tuple<std::string, Address, Amount>> entries;
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(in, line)) {
            ++lineNumber;
            std::istringstream fields(line);
            std::string asset, account, rawAmount, extra;
            if (!(fields >> asset) || asset[0] == '#') {
                continue;
            }

            auto fail = [lineNumber](const std::string& reason) {
                return std::runtime_error("Balances line " + std::to_string(lineNumber) + ": " + reason);
            };

            if (!(fields >> account >> rawAmount) || (fields >> extra)) {
                throw fail("expected <asset> <address> <amount>");
            }
            if (!AddressManager::isValidAddress(account)) {
                throw fail("invalid address '" + account + "'");
            }
            if (rawAmount.find_first_not_of("0123456789") != std::string::npos) {
                throw fail("invalid amount '" + rawAmount + "'");
            }

            Amount amount = 0;
            try {
                amount = std::stoull(rawAmount);
            } catch (const std::out_of_range&) {
                throw fail("amount out of range '" + rawAmount + "'");
            }
            if (amount == 0) {
                throw fail("amount must be positive");
            }

            entries.emplace_back(asset, AddressManager::normalizeAddress(account), amount);
        }

        for (const auto& [asset, account, amount] : entries) {
            deposit(asset, account, amount);
        }
        return entries.size();
    }

    Amount InMemoryLedger::balance(const std::string& asset, const Address& account) const {
        std::lock_guard<std::mutex> lock(ledgerMtx);
        auto it = balances.find({asset, account});
        return (it != balances.end()) ? it->second : 0;
    }

} // namespace gavel
