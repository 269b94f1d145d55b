#include "tensegrity_types.hpp"
#include <stdexcept>

namespace pretenst {

Spin opposite_spin(Spin spin) {
    switch (spin) {
        case Spin::Left: return Spin::Right;
        case Spin::Right: return Spin::Left;
        case Spin::LeftRight: return Spin::RightLeft;
        case Spin::RightLeft: return Spin::LeftRight;
    }
    throw std::invalid_argument("opposite_spin: unknown spin");
}

bool is_omni_spin(Spin spin) {
    return spin == Spin::LeftRight || spin == Spin::RightLeft;
}

const char* spin_name(Spin spin) {
    switch (spin) {
        case Spin::Left: return "Left";
        case Spin::Right: return "Right";
        case Spin::LeftRight: return "LeftRight";
        case Spin::RightLeft: return "RightLeft";
    }
    return "Unknown";
}

std::optional<FaceName> face_name_from_char(char letter) {
    if (letter >= 'a' && letter <= 'h') {
        return static_cast<FaceName>(letter - 'a');
    }
    if (letter >= 'A' && letter <= 'H') {
        return static_cast<FaceName>(static_cast<int>(FaceName::A) + (letter - 'A'));
    }
    return std::nullopt;
}

char face_name_char(FaceName name) {
    uint32_t ordinal = face_name_ordinal(name);
    return static_cast<char>((is_lower_face(name) ? 'a' : 'A') + ordinal);
}

bool is_lower_face(FaceName name) {
    return static_cast<uint8_t>(name) < static_cast<uint8_t>(FaceName::A);
}

uint32_t face_name_ordinal(FaceName name) {
    uint8_t value = static_cast<uint8_t>(name);
    return is_lower_face(name) ? value : value - static_cast<uint8_t>(FaceName::A);
}

}  // namespace pretenst
