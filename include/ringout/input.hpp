#pragma once
#include <cstdint>
#include <ringout/vec2.hpp>

namespace ringout {

inline constexpr int kInputAxisMax = 127;

// One actor's intent for one tick. Humans and the AI produce the same type.
struct InputFrame {
  std::uint64_t tick = 0;
  std::uint8_t  slot = 0;
  std::int8_t   move_x = 0;   // [-127, 127]
  std::int8_t   move_y = 0;
  bool          dash = false;

  bool operator==(const InputFrame&) const = default;
};

// Axes in range and the direction no longer than unit length.
bool input_is_legal(const InputFrame& f);

// Clamps the axes and rescales an over-long direction onto the unit circle.
InputFrame sanitize_input(const InputFrame& f);

// Quantizes a direction (length <= 1 after clamping) into a legal frame.
InputFrame quantize_input(std::uint64_t tick, std::uint8_t slot, Vec2 dir, bool dash);

// Decoded direction, length in [0, 1].
Vec2 input_direction(const InputFrame& f);

inline InputFrame idle_input(std::uint64_t tick, std::uint8_t slot) {
  return InputFrame{tick, slot, 0, 0, false};
}

} // namespace ringout
