#ifndef GAVEL_PAYMENT_ADAPTER_HPP
#define GAVEL_PAYMENT_ADAPTER_HPP

#include "gavel/AuctionTypes.hpp"
#include <string>

namespace gavel {

    /**
     * Settlement collaborator. The engine issues instructions; the adapter
     * moves the actual assets and funds. A false return is a failed transfer.
     */
    class PaymentAdapter {
    public:
        virtual ~PaymentAdapter() = default;

        // Toma en custodia un activo subastado desde su propietario
        virtual bool custody(const std::string& asset, const Address& from, Amount amount) = 0;

        // Entrega activo o fondos desde la custodia del motor
        virtual bool release(const std::string& asset, const Address& to, Amount amount) = 0;

        // Cobra el importe de una puja al pujador
        virtual bool pull(const std::string& paymentAsset, const Address& from, Amount amount) = 0;

        // Saldo total que el motor tiene en custodia para un activo
        virtual Amount balanceOf(const std::string& asset) const = 0;
    };

} // namespace gavel

#endif // GAVEL_PAYMENT_ADAPTER_HPP
