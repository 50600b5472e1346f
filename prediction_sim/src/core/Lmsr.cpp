#include "Lmsr.hpp"
#include "GameError.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace prediction {

    namespace {

        // log(exp(a) + exp(b)) shifted by the larger exponent
        double logSumExp(double a, double b) {
            double m = std::max(a, b);
            return m + std::log1p(std::exp(-std::fabs(a - b)));
        }

    } // namespace

    MarketState Lmsr::initial(double liquidity) {
        if (!std::isfinite(liquidity) || liquidity <= 0.0) {
            throw GameError(ErrorKind::CONFIGURATION, "liquidity parameter must be > 0");
        }
        MarketState state;
        state.liquidity = liquidity;
        return state;
    }

    double Lmsr::cost(double qYes, double qNo, double liquidity) {
        return liquidity * logSumExp(qYes / liquidity, qNo / liquidity);
    }

    double Lmsr::cost(const MarketState& state) {
        return cost(state.quantityYes, state.quantityNo, state.liquidity);
    }

    Prices Lmsr::price(double qYes, double qNo, double liquidity) {
        // Logistic of the scaled gap; both branches keep exp() bounded by 1
        double d = (qYes - qNo) / liquidity;
        double yes = d >= 0.0
            ? 1.0 / (1.0 + std::exp(-d))
            : std::exp(d) / (1.0 + std::exp(d));
        yes = std::clamp(yes, PRICE_EPSILON, 1.0 - PRICE_EPSILON);
        return Prices{ yes, 1.0 - yes };
    }

    Prices Lmsr::price(const MarketState& state) {
        return price(state.quantityYes, state.quantityNo, state.liquidity);
    }

    double Lmsr::logPrice(const MarketState& state, Side side) {
        double qSide = side == Side::YES ? state.quantityYes : state.quantityNo;
        double qOther = side == Side::YES ? state.quantityNo : state.quantityYes;
        double d = (qSide - qOther) / state.liquidity;
        // log(1 / (1 + exp(-d)))
        return d >= 0.0 ? -std::log1p(std::exp(-d)) : d - std::log1p(std::exp(d));
    }

    double Lmsr::tradeCost(const MarketState& state, Side side, double shares) {
        if (!std::isfinite(shares) || shares <= 0.0) {
            throw GameError(ErrorKind::INVALID_TRADE,
                "share quantity must be a finite value > 0 (got " + std::to_string(shares) + ")");
        }

        // C(q + shares) - C(q) = b * ln(p_other + p_side * exp(shares / b))
        double b = state.liquidity;
        double x = shares / b;
        double logSide = logPrice(state, side);
        double logOther = logPrice(state, side == Side::YES ? Side::NO : Side::YES);

        if (x < 1.0) {
            // ln(1 + p_side * (e^x - 1)) keeps precision for small trades
            return b * std::log1p(std::exp(logSide) * std::expm1(x));
        }
        return b * logSumExp(logOther, logSide + x);
    }

    double Lmsr::sharesForCost(const MarketState& state, Side side, double amount) {
        if (!std::isfinite(amount) || amount <= 0.0) {
            throw GameError(ErrorKind::INVALID_TRADE,
                "bet amount must be a finite value > 0 (got " + std::to_string(amount) + ")");
        }

        // Invert tradeCost: shares = b * (ln(e^(m/b) - p_other) - ln(p_side))
        double b = state.liquidity;
        double y = amount / b;
        double logSide = logPrice(state, side);

        double logNumerator;
        if (y < 1.0) {
            // e^y - p_other = (e^y - 1) + p_side
            logNumerator = std::log(std::expm1(y) + std::exp(logSide));
        }
        else {
            double logOther = logPrice(state, side == Side::YES ? Side::NO : Side::YES);
            logNumerator = y + std::log1p(-std::exp(logOther - y));
        }
        return b * (logNumerator - logSide);
    }

    TradeResult Lmsr::trade(const MarketState& state, Side side, double shares) {
        double charge = tradeCost(state, side, shares);

        TradeResult result;
        result.side = side;
        result.shares = shares;
        result.cost = charge;
        result.before = state;
        result.after = state;

        if (side == Side::YES) {
            result.after.quantityYes += shares;
        }
        else {
            result.after.quantityNo += shares;
        }

        Prices p = price(result.after);
        result.after.priceYes = p.yes;
        result.after.priceNo = p.no;
        result.after.totalVolume += charge;

        requireFinite(result.after, charge);
        return result;
    }

    TradeResult Lmsr::tradeAmount(const MarketState& state, Side side, double amount) {
        return trade(state, side, sharesForCost(state, side, amount));
    }

    void Lmsr::requireFinite(const MarketState& state, double cost) {
        if (!std::isfinite(state.quantityYes) || !std::isfinite(state.quantityNo) ||
            !std::isfinite(state.priceYes) || !std::isfinite(state.priceNo) ||
            !std::isfinite(state.totalVolume) || !std::isfinite(cost) || cost <= 0.0) {
            throw GameError(ErrorKind::NUMERIC,
                "pricing produced a non-finite or non-positive result (qYes=" +
                std::to_string(state.quantityYes) + ", qNo=" + std::to_string(state.quantityNo) +
                ", cost=" + std::to_string(cost) + ")");
        }
    }

} // namespace prediction
