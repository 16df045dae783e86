#pragma once

#include "courtops/core/model/Tournament.h"

#include <ctime>
#include <string>

namespace courtops::core::util {

bool ParseClock(const std::string& text, int& minutes_of_day);
int TimeToSlot(const std::string& time, const model::TournamentConfig& config);
std::string SlotToTime(int slot, const model::TournamentConfig& config);
int CurrentSlot(const model::TournamentConfig& config, std::time_t now);
int RestSlots(int rest_minutes, const model::TournamentConfig& config);
std::string FormatClock(std::time_t timestamp);
std::string FormatUtcTimestamp(std::time_t timestamp);

}  // namespace courtops::core::util
