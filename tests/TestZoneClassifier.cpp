#include "strategy/ZoneClassifier.h"

#include <cassert>
#include <iostream>

using namespace gridradar;
using namespace gridradar::strategy;

namespace {
IndicatorSet longLeaning() {
    IndicatorSet ind;
    ind.rsi = 30.0;             // oversold -> long
    ind.bollinger_lower = 102.0;
    ind.bollinger_upper = 118.0;
    ind.macd_line = 1.0;        // below signal -> short
    ind.macd_signal = 2.0;
    return ind;
}
}

int main() {
    std::cout << "[TEST] Starting ZoneClassifier Test..." << std::endl;

    const PriceRange range{100.0, 120.0};
    ZoneClassifier relaxed;
    ZoneClassifierConfig strict_cfg;
    strict_cfg.voting_policy = VotingPolicy::STRICT;
    ZoneClassifier strict(strict_cfg);

    // Two long votes out of three
    auto votes = relaxed.countVotes(101.0, longLeaning());
    assert(votes.long_votes == 2 && votes.short_votes == 1);
    assert(relaxed.classify(200, 101.0, range, longLeaning()) == Zone::LONG);
    assert(!strict.classify(200, 101.0, range, longLeaning()).has_value());

    // Short with all three votes passes both policies
    IndicatorSet short_ind;
    short_ind.rsi = 70.0;
    short_ind.bollinger_lower = 102.0;
    short_ind.bollinger_upper = 118.0;
    short_ind.macd_line = 1.0;
    short_ind.macd_signal = 2.0;
    assert(relaxed.classify(200, 119.0, range, short_ind) == Zone::SHORT);
    assert(strict.classify(200, 119.0, range, short_ind) == Zone::SHORT);

    // Sample and position gates
    assert(!relaxed.classify(59, 101.0, range, longLeaning()).has_value());
    assert(relaxed.classify(60, 101.0, range, longLeaning()).has_value());
    assert(!relaxed.classify(200, 110.0, range, longLeaning()).has_value());
    assert(!relaxed.classify(200, 108.0, range, longLeaning()).has_value());   // position 0.4
    assert(!relaxed.classify(200, 112.0, range, longLeaning()).has_value());   // position 0.6
    assert(!relaxed.classify(200, 101.0, {100.0, 100.0}, longLeaning()).has_value());
    assert(!relaxed.classify(200, 0.0, range, longLeaning()).has_value());

    assert(relaxed.isCentered(0.5));
    assert(!relaxed.isCentered(0.39));
    assert(!relaxed.isCentered(0.61));
    assert(!ZoneClassifier::rangePosition(5.0, {5.0, 5.0}).has_value());

    // Missing MACD contributes no vote either way
    IndicatorSet no_macd = longLeaning();
    no_macd.macd_line.reset();
    auto partial = relaxed.countVotes(101.0, no_macd);
    assert(partial.long_votes == 2 && partial.short_votes == 0);

    // Crossed bands let both directions collect two votes; long wins
    IndicatorSet tie;
    tie.rsi = 30.0;
    tie.bollinger_lower = 105.0;
    tie.bollinger_upper = 95.0;
    tie.macd_line = 1.0;
    tie.macd_signal = 2.0;
    auto tie_votes = relaxed.countVotes(101.0, tie);
    assert(tie_votes.long_votes == 2 && tie_votes.short_votes == 2);
    assert(relaxed.classify(200, 101.0, range, tie) == Zone::LONG);

    assert(votingPolicyFromString("strict") == VotingPolicy::STRICT);
    assert(votingPolicyFromString("relaxed") == VotingPolicy::RELAXED);
    assert(votingPolicyFromString("anything") == VotingPolicy::RELAXED);

    std::cout << "[TEST] ZoneClassifier Test PASSED!" << std::endl;
    return 0;
}
