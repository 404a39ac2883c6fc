#include <ringout/spatial_grid.hpp>
#include <algorithm>
#include <cmath>

namespace ringout {

namespace {

// Widen the cell until the covered square fits in kMaxCellsPerSide cells.
double capped_cell(double half_extent, double cell_size) {
  const double cell = std::isfinite(cell_size) && cell_size > 0.0 ? cell_size : 1.0;
  return std::max(cell, 2.0 * half_extent / static_cast<double>(SpatialGrid::kMaxCellsPerSide));
}

} // namespace

SpatialGrid::SpatialGrid(double half_extent, double cell_size)
  : half_extent_(std::isfinite(half_extent) && half_extent > 0.0 ? half_extent : 1.0),
    cell_(capped_cell(half_extent_, cell_size)),
    side_(std::clamp(static_cast<int>(std::ceil(2.0 * half_extent_ / cell_)), 1, kMaxCellsPerSide)),
    cells_(static_cast<std::size_t>(side_) * static_cast<std::size_t>(side_)) {}

double SpatialGrid::cell_size_for(double max_radius, double max_step) {
  return std::max({2.0 * max_radius, max_step, 1.0});
}

int SpatialGrid::cell_coord_(double v) const {
  if (!std::isfinite(v)) return 0;
  const double c = std::floor((v + half_extent_) / cell_);
  if (c < 0.0) return 0;
  if (c >= static_cast<double>(side_)) return side_ - 1;
  return static_cast<int>(c);
}

void SpatialGrid::clear() {
  for (auto& c : cells_) c.clear();
  entities_.clear();
  max_radius_ = 0.0;
}

void SpatialGrid::insert(EntityId id, Vec2 pos, double radius) {
  const auto idx = static_cast<std::uint32_t>(entities_.size());
  entities_.push_back(GridEntity{id, pos, radius});
  max_radius_ = std::max(max_radius_, radius);
  const int cx = cell_coord_(pos.x);
  const int cy = cell_coord_(pos.y);
  cells_[static_cast<std::size_t>(cy) * side_ + cx].push_back(idx);
}

void SpatialGrid::clear_and_rebuild(const std::vector<GridEntity>& entities) {
  clear();
  for (const auto& e : entities) insert(e.id, e.pos, e.radius);
}

const GridEntity* SpatialGrid::find(EntityId id) const {
  for (const auto& e : entities_) if (e.id == id) return &e;
  return nullptr;
}

template <class Pred>
std::vector<EntityId> SpatialGrid::scan_(double min_x, double min_y, double max_x, double max_y,
                                         Pred&& keep) const {
  candidates_ = 0;
  std::vector<EntityId> out;
  const int x0 = cell_coord_(min_x), x1 = cell_coord_(max_x);
  const int y0 = cell_coord_(min_y), y1 = cell_coord_(max_y);
  for (int cy = y0; cy <= y1; ++cy) {
    for (int cx = x0; cx <= x1; ++cx) {
      for (std::uint32_t idx : cells_[static_cast<std::size_t>(cy) * side_ + cx]) {
        ++candidates_;
        const auto& e = entities_[idx];
        if (keep(e)) out.push_back(e.id);
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<EntityId> SpatialGrid::query_radius(Vec2 pos, double radius) const {
  const double reach = radius + max_radius_;
  return scan_(pos.x - reach, pos.y - reach, pos.x + reach, pos.y + reach,
               [&](const GridEntity& e) {
                 const double r = radius + e.radius;
                 return length_sq(e.pos - pos) <= r * r;
               });
}

std::vector<EntityId> SpatialGrid::query_swept(Vec2 start, Vec2 end, double radius) const {
  const double reach = radius + max_radius_;
  return scan_(std::min(start.x, end.x) - reach, std::min(start.y, end.y) - reach,
               std::max(start.x, end.x) + reach, std::max(start.y, end.y) + reach,
               [&](const GridEntity& e) {
                 const double r = radius + e.radius;
                 return distance_sq_point_segment(e.pos, start, end) <= r * r;
               });
}

} // namespace ringout
