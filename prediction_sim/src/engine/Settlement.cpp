#include "Settlement.hpp"
#include "utils/Logger.hpp"

namespace prediction {

    SettlementReport Settlement::settle(const MarketState& market,
        std::vector<std::unique_ptr<Agent>>& agents,
        bool outcome,
        const GameConfig::SettlementParams& params) {
        SettlementReport report;
        Stance winning = outcome ? Stance::YES : Stance::NO;

        for (auto& agent : agents) {
            Stance stance = agent->getStance();

            double winningShares = outcome ? agent->getYesShares() : agent->getNoShares();
            double payout = winningShares * params.payoutPerShare;
            double pnl = payout - agent->getTotalSpent();

            ReputationChange change;
            change.agentId = agent->getId();
            change.before = agent->getReputation();

            if (stance == Stance::NEUTRAL) {
                change.change = 0;
                change.reason = "No position";
            }
            else if (stance == winning) {
                change.change = params.winnerReputation;
                change.reason = "Correct prediction";
                report.winners.push_back(agent->getId());
            }
            else {
                change.change = params.loserReputation;
                change.reason = "Incorrect prediction";
                report.losers.push_back(agent->getId());
            }
            change.after = change.before + change.change;

            agent->settle(pnl, change.change);
            report.reputationChanges.push_back(change);
            report.totalPnL += pnl;
            report.totalPayout += payout;
        }

        Logger::info("Settlement ({}): {} winners, {} losers, payout {:.2f} against volume {:.2f}",
            outcome ? "YES" : "NO", report.winners.size(), report.losers.size(),
            report.totalPayout, market.totalVolume);

        return report;
    }

} // namespace prediction
