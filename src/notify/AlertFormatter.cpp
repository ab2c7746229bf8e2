#include "notify/AlertFormatter.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gridradar {
namespace notify {

std::string AlertFormatter::formatPrice(double price) {
    std::ostringstream oss;
    if (price < 0.1) {
        oss << std::fixed << std::setprecision(8) << price;
        return "$" + oss.str();
    }
    oss << std::fixed << std::setprecision(price < 1.0 ? 4 : 2) << price;
    return "$" + withThousandsSeparators(oss.str());
}

std::string AlertFormatter::formatTransition(const engine::Transition& transition) {
    using engine::TransitionKind;

    std::ostringstream oss;
    switch (transition.kind) {
        case TransitionKind::NEW:
            oss << "*" << transition.market << "*  New grid opportunity\n"
                << formatPlan(*transition.signal);
            break;
        case TransitionKind::FLIPPED:
            oss << "*" << transition.market << "*  Flipped "
                << zoneToString(transition.previous->zone) << " -> "
                << zoneToString(transition.signal->zone) << "\n"
                << formatPlan(*transition.signal);
            break;
        case TransitionKind::EXITED_BY_RANGE:
            oss << "*" << transition.market << "* left its range `"
                << formatPrice(transition.previous->low) << " - "
                << formatPrice(transition.previous->high) << "` at "
                << formatPrice(transition.reference_price)
                << " - consider closing its grid bot.\nNew range:\n"
                << formatPlan(*transition.signal);
            if (transition.tracked_range) {
                oss << "\nTracking: `" << formatPrice(transition.tracked_range->low) << " - "
                    << formatPrice(transition.tracked_range->high) << "`";
            }
            break;
        case TransitionKind::EXITED_NO_LONGER_QUALIFIES:
            oss << "*" << transition.market << "* dropped (no longer qualifies) - "
                << zoneToString(transition.previous->zone) << " `"
                << formatPrice(transition.previous->low) << " - "
                << formatPrice(transition.previous->high) << "`, ref. "
                << formatPrice(transition.reference_price)
                << " - consider closing its grid bot.";
            break;
        case TransitionKind::CONTINUING:
            return "";
    }
    return oss.str();
}

std::string AlertFormatter::formatContinuing(const engine::Transition& transition) {
    if (!transition.signal) {
        return "";
    }
    std::ostringstream oss;
    oss << "*" << transition.market << "* still in its " << zoneToString(transition.signal->zone)
        << " zone `" << formatPrice(transition.signal->plan.low) << " - "
        << formatPrice(transition.signal->plan.high) << "`  |  Score: `"
        << std::fixed << std::setprecision(1) << transition.signal->score << "`";
    return oss.str();
}

std::string AlertFormatter::formatWarning(const engine::CycleWarning& warning) {
    std::ostringstream oss;
    oss << "*" << warning.market << "* grid cycle nearly complete (~"
        << std::fixed << std::setprecision(1) << std::max(0.0, warning.remaining_hours)
        << " h left of " << warning.entry.cycle_days << " days, "
        << zoneToString(warning.entry.zone) << " `"
        << formatPrice(warning.entry.low) << " - " << formatPrice(warning.entry.high) << "`)";
    return oss.str();
}

std::string AlertFormatter::formatHeader(Timestamp now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << "*Grid Scanner* - " << std::put_time(&tm_utc, "%Y-%m-%d %H:%M") << " UTC";
    return oss.str();
}

std::string AlertFormatter::formatNoOpportunities(Timestamp now) {
    return formatHeader(now) + "\nNo instruments met the grid criteria.";
}

std::string AlertFormatter::formatFailure(const std::string& reason) {
    return "*Grid Scanner* failed: " + reason;
}

std::vector<std::string> AlertFormatter::chunkMessages(
    const std::vector<std::string>& messages,
    std::size_t max_length)
{
    std::vector<std::string> chunks;
    if (max_length == 0) {
        return chunks;
    }

    std::string buffer;
    auto flush = [&]() {
        while (buffer.size() > max_length) {
            chunks.push_back(buffer.substr(0, max_length));
            buffer.erase(0, max_length);
        }
        if (!buffer.empty()) {
            chunks.push_back(buffer);
        }
        buffer.clear();
    };

    for (const auto& message : messages) {
        if (message.empty()) {
            continue;
        }
        if (!buffer.empty() && buffer.size() + message.size() + 2 > max_length) {
            flush();
        }
        if (!buffer.empty()) {
            buffer += "\n\n";
        }
        buffer += message;
    }
    flush();
    return chunks;
}

std::string AlertFormatter::formatPlan(const strategy::GridSignal& signal) {
    const auto& plan = signal.plan;

    std::ostringstream oss;
    oss << "Range: `" << formatPrice(plan.low) << " - " << formatPrice(plan.high) << "`\n"
        << "Entry Zone: " << zoneToString(signal.zone) << "\n"
        << "Grids: `" << plan.grid_count << "`  |  Spacing: `"
        << std::fixed << std::setprecision(2) << plan.spacing_pct << "%`\n"
        << "Volatility: `" << std::setprecision(1) << signal.indicators.volatility_pct
        << "%`  |  Cycle: `" << plan.cycle_days << " days`  |  Score: `" << signal.score << "`";
    return oss.str();
}

std::string AlertFormatter::withThousandsSeparators(const std::string& fixed) {
    const auto dot = fixed.find('.');
    std::string integer = fixed.substr(0, dot);
    const std::string fraction = dot == std::string::npos ? "" : fixed.substr(dot);

    std::string sign;
    if (!integer.empty() && integer[0] == '-') {
        sign = "-";
        integer.erase(0, 1);
    }

    std::string grouped;
    int digits = 0;
    for (auto it = integer.rbegin(); it != integer.rend(); ++it) {
        if (digits > 0 && digits % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++digits;
    }
    return sign + grouped + fraction;
}

} // namespace notify
} // namespace gridradar
