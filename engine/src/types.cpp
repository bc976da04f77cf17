#include "types.hpp"
#include "errors.hpp"

std::string to_string(Side side) {
    return side == Side::Long ? "LONG" : "SHORT";
}

std::string to_string(SetupType type) {
    switch (type) {
        case SetupType::Momentum: return "MOMENTUM";
        case SetupType::Pullback: return "PULLBACK";
        case SetupType::Bounce: return "BOUNCE";
    }
    return "MOMENTUM";
}

Side side_from_string(const std::string& s) {
    if (s == "LONG") return Side::Long;
    if (s == "SHORT") return Side::Short;
    throw DataError("Unknown side: " + s);
}

SetupType setup_type_from_string(const std::string& s) {
    if (s == "MOMENTUM") return SetupType::Momentum;
    if (s == "PULLBACK") return SetupType::Pullback;
    if (s == "BOUNCE") return SetupType::Bounce;
    throw DataError("Unknown setup type: " + s);
}
