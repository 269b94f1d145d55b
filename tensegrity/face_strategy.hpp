#ifndef PRETENST_TENSEGRITY_FACE_STRATEGY_HPP
#define PRETENST_TENSEGRITY_FACE_STRATEGY_HPP

#include "tensegrity_types.hpp"
#include <tenscript/ast.hpp>
#include <map>
#include <vector>

namespace pretenst {

class TensegrityBuilder;

// What to do with the faces sharing one mark once growth is complete
class FaceStrategy {
public:
    FaceStrategy(std::vector<FaceId> faces, tenscript::Mark mark);

    void execute(TensegrityBuilder& builder) const;

    const std::vector<FaceId>& faces() const { return faces_; }
    const tenscript::Mark& mark() const { return mark_; }

private:
    std::vector<FaceId> faces_;
    tenscript::Mark mark_;
};

// Collate marked faces by mark number. A mark without a declared action
// becomes a base face when it is on one face and a join otherwise.
std::vector<FaceStrategy> face_strategies(const std::vector<Face>& faces,
                                          const std::map<int, tenscript::Mark>& marks);

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_FACE_STRATEGY_HPP
