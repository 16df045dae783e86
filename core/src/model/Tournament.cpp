#include "courtops/core/model/Tournament.h"

#include <algorithm>

namespace courtops::core::model {

std::vector<std::string> Match::PlayerIds() const {
    std::vector<std::string> ids;
    ids.reserve(side_a.size() + side_b.size() + side_c.size());
    ids.insert(ids.end(), side_a.begin(), side_a.end());
    ids.insert(ids.end(), side_b.begin(), side_b.end());
    ids.insert(ids.end(), side_c.begin(), side_c.end());
    return ids;
}

bool Match::HasPlayer(const std::string& player_id) const {
    const auto contains = [&](const std::vector<std::string>& side) {
        return std::find(side.begin(), side.end(), player_id) != side.end();
    };
    return contains(side_a) || contains(side_b) || contains(side_c);
}

std::string Match::Label() const {
    if (!event_rank.empty()) {
        return event_rank;
    }
    if (match_number) {
        return "M" + std::to_string(*match_number);
    }
    return id;
}

bool SharesPlayer(const Match& lhs, const Match& rhs) {
    for (const auto& player_id : lhs.PlayerIds()) {
        if (rhs.HasPlayer(player_id)) {
            return true;
        }
    }
    return false;
}

}  // namespace courtops::core::model
