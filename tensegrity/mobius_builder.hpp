#ifndef PRETENST_TENSEGRITY_MOBIUS_BUILDER_HPP
#define PRETENST_TENSEGRITY_MOBIUS_BUILDER_HPP

#include <cstdint>

namespace pretenst {

class Tensegrity;

// Builds a half-twisted ribbon loop of crossing pushes directly, without
// tenscript. Two joints per segment, bottom then top.
class MobiusBuilder {
public:
    explicit MobiusBuilder(uint32_t segments);

    // Adds the ribbon to an empty structure. Throws std::logic_error if the
    // structure already has joints.
    void build(Tensegrity& tensegrity) const;

    uint32_t segments() const { return segments_; }

private:
    uint32_t segments_;
};

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_MOBIUS_BUILDER_HPP
