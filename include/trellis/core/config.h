#ifndef TRELLIS_CORE_CONFIG_H
#define TRELLIS_CORE_CONFIG_H

namespace trellis::core::config {

// All lengths are in dots, the single absolute unit the engine consumes.
inline constexpr float kDefaultMinSize = 2.0f;
inline constexpr float kDefaultScrollBarWidth = 16.0f;
inline constexpr float kDefaultLineHeight = 12.0f;
inline constexpr float kSplitHandleSize = 10.0f;

// Preferred sizes may overshoot the available space by this much before
// allocation falls back to needed sizes.
inline constexpr float kFitTolerance = 0.1f;

inline constexpr float kPageStepLines = 10.0f;

}  // namespace trellis::core::config

#endif  // TRELLIS_CORE_CONFIG_H
