#include "GameEngine.hpp"
#include "core/GameError.hpp"
#include "core/Lmsr.hpp"
#include "utils/Logger.hpp"
#include <algorithm>

namespace prediction {

    GameEngine::GameEngine(const GameConfig& config, Random& rng, EventLog& log, SimClock& clock)
        : config_(config)
        , rng_(rng)
        , log_(log)
        , clock_(clock)
        , market_(Lmsr::initial(config.liquidityParameter))
    {
    }

    void GameEngine::initialize() {
        clueNetwork_ = ClueNetwork(ClueNetwork::buildClueNetwork(config_, config_.outcome, rng_));
        clueNetwork_.setInsiderReach(config_.clues.insiderReach);
        clueNetwork_.setSpreadDelay(config_.clues.spreadDelayDays);

        addAgents(AgentFactory::createPopulation(config_, rng_));

        Logger::info("Game engine initialized: {} clues, {} agents ({} insiders), b = {}",
            clueNetwork_.getClues().size(), agents_.size(), insiderIds_.size(), market_.liquidity);
    }

    void GameEngine::addAgents(std::vector<std::unique_ptr<Agent>> newAgents) {
        for (auto& agent : newAgents) {
            agents_.push_back(std::move(agent));
        }

        std::sort(agents_.begin(), agents_.end(),
            [](const auto& a, const auto& b) { return a->getId() < b->getId(); });

        insiderIds_.clear();
        allIds_.clear();
        for (const auto& agent : agents_) {
            allIds_.push_back(agent->getId());
            if (agent->isInsider()) insiderIds_.push_back(agent->getId());
        }
    }

    Agent* GameEngine::getAgent(AgentId id) {
        auto it = std::lower_bound(agents_.begin(), agents_.end(), id,
            [](const auto& agent, AgentId value) { return agent->getId() < value; });
        return (it != agents_.end() && (*it)->getId() == id) ? it->get() : nullptr;
    }

    void GameEngine::runDay(Day day) {
        clock_.beginDay(day);
        log_.emit(day, DayChangedPayload{ day });

        distributeClues(day);

        processAgentDecisions(day);

        if (day % config_.social.postEveryDays == 0) {
            emitCheckpoint(day);
        }

        Logger::debug("Day {} ({}): YES {:.3f} / NO {:.3f}, volume {:.2f}, {} bets so far",
            day, clock_.currentDateString(), market_.priceYes, market_.priceNo,
            market_.totalVolume, totalBets_);
    }

    void GameEngine::distributeClues(Day day) {
        auto deliveries = clueNetwork_.release(day, insiderIds_, allIds_, rng_);

        for (const auto& delivery : deliveries) {
            const Clue* clue = clueNetwork_.find(delivery.clueId);
            Agent* agent = getAgent(delivery.agentId);
            if (!clue || !agent) continue;

            agent->receiveClue(clue->id, day);

            ClueDistributedPayload payload;
            payload.clueId = clue->id;
            payload.agentId = agent->getId();
            payload.signal = clue->signal;
            payload.reliability = clue->reliability;
            payload.tier = clue->tier;
            payload.phase = delivery.phase;
            log_.emit(day, payload);
        }
    }

    void GameEngine::processAgentDecisions(Day day) {
        for (auto& agent : agents_) {
            Action action = decideFor(*agent, day);
            if (!action.isBet()) continue;

            try {
                executeBet(*agent, action.side, action.amount, day);
            }
            catch (const GameError& e) {
                // Rejected agent bets downgrade to Hold; everything else is fatal
                if (e.kind() != ErrorKind::INVALID_TRADE) throw;
                Logger::warn("Day {}: bet of agent {} rejected, holding: {}", day, agent->getId(), e.what());
                diagnostics_.push_back(DayDiagnostic{ day, agent->getId(), e.what() });
            }
        }
    }

    Action GameEngine::decideFor(Agent& agent, Day day) {
        DecisionContext ctx{ clueNetwork_, market_, day, config_.duration, rng_ };
        try {
            return agent.decide(ctx);
        }
        catch (const AgentDecisionError& e) {
            Logger::warn("Day {}: decision of agent {} failed, holding: {}", day, agent.getId(), e.what());
            diagnostics_.push_back(DayDiagnostic{ day, agent.getId(), e.what() });
            return Action::hold();
        }
    }

    Action GameEngine::previewFor(Agent& agent, Day day) {
        Random preview = rng_;
        DecisionContext ctx{ clueNetwork_, market_, day, config_.duration, preview };
        try {
            return agent.decide(ctx);
        }
        catch (const AgentDecisionError& e) {
            Logger::debug("Day {}: preview of agent {} failed, holding: {}", day, agent.getId(), e.what());
            return Action::hold();
        }
    }

    TradeResult GameEngine::executeBet(Agent& agent, Side side, double amount, Day day) {
        if (agent.isFrozen()) {
            throw GameError(ErrorKind::POST_RESOLUTION, agent.getName() + " is settled and cannot trade");
        }
        if (!(amount > 0.0) || amount > agent.getBalance()) {
            throw GameError(ErrorKind::INVALID_TRADE,
                agent.getName() + " cannot bet " + std::to_string(amount) +
                " with balance " + std::to_string(agent.getBalance()));
        }

        TradeResult fill = Lmsr::tradeAmount(market_, side, amount);
        market_ = fill.after;
        agent.onFill(fill);

        totalBets_++;
        auto& stats = roleStats_[agent.getRole()];
        stats.betsPlaced++;
        if (side == Side::YES) stats.yesBets++;
        else stats.noBets++;
        stats.sharesBought += fill.shares;
        stats.cashSpent += fill.cost;

        Logger::trace("Day {}: agent {} bet {:.2f} on {} -> {:.3f} shares, YES now {:.4f}",
            day, agent.getId(), fill.cost, toString(side), fill.shares, market_.priceYes);

        AgentBetPayload bet;
        bet.agentId = agent.getId();
        bet.side = side;
        bet.amount = amount;
        bet.shares = fill.shares;
        bet.cost = fill.cost;
        bet.priceBefore = fill.before.price(side);
        bet.priceAfter = fill.after.price(side);
        log_.emit(day, bet);
        log_.emit(day, MarketUpdatedPayload{ market_ });

        return fill;
    }

    void GameEngine::emitCheckpoint(Day day) {
        size_t posters = static_cast<size_t>(config_.social.postersPerCheckpoint);
        for (AgentId id : rng_.sample(allIds_, posters)) {
            const Agent* agent = getAgent(id);
            if (!agent) continue;

            AgentPostPayload post;
            post.agentId = id;
            post.stance = agent->getStance();
            post.betsPlaced = agent->getBetsPlaced();
            post.priceYes = market_.priceYes;
            post.priceNo = market_.priceNo;
            post.totalVolume = market_.totalVolume;
            log_.emit(day, post);
        }
    }

} // namespace prediction
