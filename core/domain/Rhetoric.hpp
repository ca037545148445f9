#pragma once

#include "../Event.hpp"
#include <string>
#include <vector>

namespace senate::domain {

// Stock phrases used when an agent reacts or interjects. Each list is non-empty.
std::vector<std::string> reactionLines(ReactionType type, const std::string& speakerName);
std::vector<std::string> latinInterjections(InterjectionType type);
std::vector<std::string> englishInterjections(InterjectionType type, const std::string& speakerName);

} // namespace senate::domain
