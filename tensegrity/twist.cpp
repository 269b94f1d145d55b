#include "twist.hpp"
#include <stdexcept>
#include <string>

namespace pretenst {

namespace {

std::optional<size_t> face_position(const Twist& twist, FaceName name) {
    if (twist.faces.empty()) {
        return std::nullopt;
    }
    uint32_t ordinal = face_name_ordinal(name);
    bool lower = is_lower_face(name);
    if (ordinal == 0) {
        return lower ? size_t{0} : twist.faces.size() - 1;
    }
    if (!twist.omni || twist.faces.size() < 2) {
        return std::nullopt;
    }
    size_t touching = (twist.faces.size() - 2) / 2;
    if (ordinal > touching) {
        return std::nullopt;
    }
    return lower ? size_t{ordinal} : touching + ordinal;
}

}  // namespace

FaceId Twist::face(FaceName name) const {
    auto position = face_position(*this, name);
    if (!position) {
        throw std::out_of_range(std::string("Twist::face: no face ") + face_name_char(name));
    }
    return faces[*position];
}

bool Twist::has_face(FaceName name) const {
    return face_position(*this, name).has_value();
}

}  // namespace pretenst
