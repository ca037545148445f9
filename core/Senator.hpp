#pragma once

#include <string>
#include <optional>

namespace senate {

struct Senator {
    std::string id;
    std::string name;
    std::string faction;
    int rank = 0;
};

inline bool operator==(const Senator& lhs, const Senator& rhs) {
    return lhs.id == rhs.id;
}

inline bool operator!=(const Senator& lhs, const Senator& rhs) {
    return !(lhs == rhs);
}

enum class Stance {
    Support,
    Oppose,
    Neutral
};

std::string stanceToString(Stance stance);
std::optional<Stance> stringToStance(const std::string& str);

} // namespace senate
