#pragma once

#include <string>

namespace senate {

class Uuid {
public:
    static std::string generateV4();
    static bool isValid(const std::string& value);

private:
    static std::string format(const unsigned char (&bytes)[16]);
};

} // namespace senate
