#pragma once

#include "engine/StateTransitionEngine.h"
#include <string>
#include <vector>

namespace gridradar {
namespace notify {

// Builds Markdown alert text; delivery is someone else's job
class AlertFormatter {
public:
    // $0.01234567 below 0.1, $0.1234 below 1, $12,345.68 otherwise
    static std::string formatPrice(double price);

    // Empty string for transitions that are not alerted (Continuing)
    static std::string formatTransition(const engine::Transition& transition);
    static std::string formatContinuing(const engine::Transition& transition);
    static std::string formatWarning(const engine::CycleWarning& warning);
    static std::string formatHeader(Timestamp now);
    static std::string formatNoOpportunities(Timestamp now);
    static std::string formatFailure(const std::string& reason);

    // Joins messages with blank lines into chunks of at most max_length
    // characters; a single oversized message is split hard
    static std::vector<std::string> chunkMessages(const std::vector<std::string>& messages,
                                                  std::size_t max_length);

private:
    static std::string formatPlan(const strategy::GridSignal& signal);
    static std::string withThousandsSeparators(const std::string& fixed);
};

} // namespace notify
} // namespace gridradar
