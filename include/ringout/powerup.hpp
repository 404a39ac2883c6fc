#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include <ringout/actor.hpp>
#include <ringout/config.hpp>
#include <ringout/events.hpp>
#include <ringout/rng.hpp>
#include <ringout/spatial_grid.hpp>

namespace ringout {

enum class SlotState : int { Empty = 0, Spawning, Active, Claimed, Expired };

const char* to_string(SlotState s);

struct PowerUp {
  PowerUpKind kind = PowerUpKind::SpeedBoost;
  Vec2 pos{};
  std::uint64_t spawn_tick = 0;   // tick it became claimable
  std::uint64_t expiry_tick = 0;
  bool claimed = false;
};

struct PowerUpSlot {
  SlotState state = SlotState::Empty;
  int timer_ticks = 0;            // Spawning countdown
  PowerUp item{};
};

// Owns the power-up slots of one match. All randomness comes from the
// power-up stream passed in by the match.
class PowerUpManager {
public:
  PowerUpManager(const MatchConfig& cfg, MatchRng& rng);

  // Slot transitions for this tick: recycle finished slots, activate
  // telegraphed spawns, expire stale items, and start a new spawn when the
  // cadence is due and a slot is free.
  void advance(std::uint64_t tick, double arena_radius, MatchRng& rng, EventList& events);

  // Appends every claimable item as a point entity.
  void register_entities(std::vector<GridEntity>& out) const;

  // Claims in slot order (0 then 1) along each actor's movement this tick.
  void resolve_pickups(std::uint64_t tick,
                       std::array<Actor, kActorCount>& actors,
                       const std::array<Vec2, kActorCount>& start_pos,
                       const SpatialGrid& grid,
                       double arena_radius,
                       MatchRng& rng,
                       EventList& events);

  const std::vector<PowerUpSlot>& slots() const { return slots_; }
  int active_count() const;
  std::uint64_t next_spawn_tick() const { return next_spawn_tick_; }

private:
  void schedule_next_(std::uint64_t from_tick, MatchRng& rng);
  void activate_(std::size_t i, std::uint64_t tick, EventList& events);
  // Returns the affected opponent slot (Freeze) or kNoActor.
  int apply_(PowerUpKind kind, Actor& claimant, Actor& opponent, double arena_radius,
             MatchRng& rng, std::uint64_t tick);

  MatchConfig cfg_;
  std::vector<PowerUpSlot> slots_;
  std::uint64_t next_spawn_tick_{0};
  int telegraph_ticks_;
  int lifetime_ticks_;
  int effect_ticks_;
  int freeze_ticks_;
};

// Decrements every active effect on the actor; emits EffectExpired when one
// reaches zero. Extra dash charges vanish with MultiDash.
void tick_effects(Actor& a, const MatchConfig& cfg, std::uint64_t tick, EventList& events);

} // namespace ringout
