#ifndef PRETENST_ENGINE_STAGE_HPP
#define PRETENST_ENGINE_STAGE_HPP

namespace pretenst {

// Construction stages, in the order a structure normally passes through them
enum class Stage {
    Growing,
    Shaping,
    Slack,
    Pretensing,
    Pretenst,
};

inline const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Growing: return "Growing";
        case Stage::Shaping: return "Shaping";
        case Stage::Slack: return "Slack";
        case Stage::Pretensing: return "Pretensing";
        case Stage::Pretenst: return "Pretenst";
    }
    return "Unknown";
}

}  // namespace pretenst

#endif // PRETENST_ENGINE_STAGE_HPP
