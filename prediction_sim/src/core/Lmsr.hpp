#pragma once

#include "Types.hpp"

namespace prediction {

    struct Prices {
        double yes;
        double no;
    };

    // Logarithmic market scoring rule over two outcomes.
    //
    //   C(qYes, qNo) = b * ln(exp(qYes / b) + exp(qNo / b))
    //   p_yes        = exp(qYes / b) / (exp(qYes / b) + exp(qNo / b))
    //
    // Every evaluation is shifted by max(qYes, qNo) (log-sum-exp) so large
    // quantities never overflow. All functions are pure: a trade returns the
    // new state instead of mutating the old one.
    class Lmsr {
    public:
        // Prices never leave [PRICE_EPSILON, 1 - PRICE_EPSILON]. Past a quantity
        // gap of about 34.5 b the price sits on the clamp and stops moving.
        static constexpr double PRICE_EPSILON = 1e-15;

        static MarketState initial(double liquidity);

        static double cost(double qYes, double qNo, double liquidity);
        static double cost(const MarketState& state);

        static Prices price(double qYes, double qNo, double liquidity);
        static Prices price(const MarketState& state);

        // Charge for buying `shares` (> 0) of `side`: C(after) - C(before)
        static double tradeCost(const MarketState& state, Side side, double shares);

        // Shares of `side` that `amount` (> 0) of currency buys
        static double sharesForCost(const MarketState& state, Side side, double amount);

        // Buy `shares` (> 0) of `side`; returns cost and the updated state
        static TradeResult trade(const MarketState& state, Side side, double shares);

        // Spend `amount` (> 0) of currency on `side`
        static TradeResult tradeAmount(const MarketState& state, Side side, double amount);

    private:
        // log(p_side) computed from the quantity gap, no underflow to log(0)
        static double logPrice(const MarketState& state, Side side);

        static void requireFinite(const MarketState& state, double cost);
    };

} // namespace prediction
