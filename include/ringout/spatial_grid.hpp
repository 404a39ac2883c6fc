#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <ringout/vec2.hpp>

namespace ringout {

using EntityId = std::uint32_t;

// Actor ids are their slots; power-up ids start at kPowerUpIdBase + slot.
inline constexpr EntityId kPowerUpIdBase = 16;

inline EntityId actor_entity(std::size_t slot) { return static_cast<EntityId>(slot); }
inline EntityId powerup_entity(std::size_t slot) { return kPowerUpIdBase + static_cast<EntityId>(slot); }
inline bool is_powerup_entity(EntityId id) { return id >= kPowerUpIdBase; }
inline std::size_t powerup_slot_of(EntityId id) { return static_cast<std::size_t>(id - kPowerUpIdBase); }

struct GridEntity {
  EntityId id = 0;
  Vec2 pos{};
  double radius = 0.0;
};

// Flat uniform grid centred on the origin, rebuilt every tick.
// Each entity lives in the cell containing its centre (clamped to the edge
// cells when outside the covered square). Queries expand their bounding box by
// the largest inserted radius, scan the overlapped cells, and keep only exact
// circle/capsule overlaps. Results are sorted by id.
class SpatialGrid {
public:
  // Larger arenas get wider cells instead of more of them.
  static constexpr int kMaxCellsPerSide = 256;

  SpatialGrid() : SpatialGrid(512.0, 64.0) {}
  SpatialGrid(double half_extent, double cell_size);

  void clear();
  void insert(EntityId id, Vec2 pos, double radius);
  void clear_and_rebuild(const std::vector<GridEntity>& entities);

  // Entities whose circle overlaps the circle (pos, radius).
  std::vector<EntityId> query_radius(Vec2 pos, double radius) const;
  // Entities whose circle overlaps the capsule swept by a circle of `radius`
  // moving from start to end.
  std::vector<EntityId> query_swept(Vec2 start, Vec2 end, double radius) const;

  // Cell side from the largest collision radius and per-tick displacement.
  static double cell_size_for(double max_radius, double max_step);

  const GridEntity* find(EntityId id) const;
  std::size_t size() const { return entities_.size(); }
  int cells_per_side() const { return side_; }
  double cell_size() const { return cell_; }
  // Entities examined by the most recent query (broad-phase cost).
  std::size_t candidates_last_query() const { return candidates_; }

private:
  int cell_coord_(double v) const;
  template <class Pred>
  std::vector<EntityId> scan_(double min_x, double min_y, double max_x, double max_y, Pred&& keep) const;

  double half_extent_;
  double cell_;
  int side_;
  double max_radius_{0.0};
  std::vector<GridEntity> entities_;
  std::vector<std::vector<std::uint32_t>> cells_;  // indices into entities_
  mutable std::size_t candidates_{0};
};

} // namespace ringout
