#ifndef PRETENST_TENSEGRITY_FABRIC_OUTPUT_HPP
#define PRETENST_TENSEGRITY_FABRIC_OUTPUT_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace pretenst {

// Exported with z up
struct OutputJoint {
    uint32_t index = 0;
    float radius = 0.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct OutputInterval {
    uint32_t index = 0;
    std::array<uint32_t, 2> joints = {0, 0};
    std::string type;           // "Push" or "Pull"
    float strain = 0.0f;
    float stiffness = 0.0f;
    float linear_density = 0.0f;
    std::string role;
    float scale = 100.0f;       // percent
    float ideal_length = 0.0f;
    bool is_push = false;
    float length = 0.0f;
    float radius = 0.0f;
};

// Snapshot of a structure for export
struct FabricOutput {
    std::string name;
    std::vector<OutputJoint> joints;
    std::vector<OutputInterval> intervals;
};

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_FABRIC_OUTPUT_HPP
