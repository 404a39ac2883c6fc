#include <catch2/catch.hpp>
#include <vector>

#include <ringout/spatial_grid.hpp>

using namespace ringout;

static bool contains(const std::vector<EntityId>& v, EntityId id) {
  for (EntityId x : v) if (x == id) return true;
  return false;
}

TEST_CASE("Radius query keeps exact circle overlaps only") {
  SpatialGrid g(100.0, 10.0);
  g.insert(actor_entity(0), Vec2{0.0, 0.0}, 1.0);
  g.insert(actor_entity(1), Vec2{50.0, 50.0}, 1.0);
  g.insert(powerup_entity(0), Vec2{5.0, 0.0}, 0.0);

  const auto near = g.query_radius(Vec2{0.0, 0.0}, 4.0);
  REQUIRE(near == std::vector<EntityId>{0});

  const auto touching = g.query_radius(Vec2{0.0, 0.0}, 5.0);
  REQUIRE(touching == std::vector<EntityId>{0, powerup_entity(0)});
}

TEST_CASE("Swept query finds entities crossed between two points") {
  SpatialGrid g(100.0, 10.0);
  g.insert(actor_entity(1), Vec2{0.0, 0.0}, 1.0);

  // A point test at the end of a 20 unit step passes straight through.
  REQUIRE(g.query_radius(Vec2{10.0, 0.0}, 1.0).empty());
  const auto hits = g.query_swept(Vec2{-10.0, 0.0}, Vec2{10.0, 0.0}, 1.0);
  REQUIRE(contains(hits, actor_entity(1)));

  REQUIRE(g.query_swept(Vec2{-10.0, 5.0}, Vec2{10.0, 5.0}, 1.0).empty());
}

TEST_CASE("Entities outside the covered square land in edge cells") {
  SpatialGrid g(100.0, 10.0);
  g.insert(7, Vec2{500.0, 500.0}, 1.0);
  REQUIRE(contains(g.query_radius(Vec2{500.0, 500.0}, 1.0), 7));
  REQUIRE(g.query_radius(Vec2{95.0, 95.0}, 1.0).empty());
}

TEST_CASE("Results are sorted by id regardless of insertion order") {
  SpatialGrid g(100.0, 10.0);
  g.insert(powerup_entity(2), Vec2{1.0, 0.0}, 0.0);
  g.insert(actor_entity(1), Vec2{-1.0, 0.0}, 2.0);
  g.insert(actor_entity(0), Vec2{0.0, 1.0}, 2.0);
  const auto hits = g.query_radius(Vec2{}, 3.0);
  REQUIRE(hits == std::vector<EntityId>{0, 1, powerup_entity(2)});
}

TEST_CASE("Queries only examine nearby cells") {
  SpatialGrid g(100.0, 10.0);
  for (int i = 0; i < 50; ++i) g.insert(static_cast<EntityId>(i), Vec2{-75.0 + 3.0 * i, 60.0}, 0.5);
  REQUIRE(g.size() == 50);

  REQUIRE(g.query_radius(Vec2{-90.0, -90.0}, 1.0).empty());
  REQUIRE(g.candidates_last_query() < g.size());
}

TEST_CASE("clear_and_rebuild replaces the contents") {
  SpatialGrid g(100.0, 10.0);
  g.insert(0, Vec2{}, 1.0);
  g.clear_and_rebuild({GridEntity{3, Vec2{20.0, 0.0}, 1.0}});
  REQUIRE(g.size() == 1);
  REQUIRE(g.find(0) == nullptr);
  REQUIRE(g.find(3) != nullptr);
  REQUIRE(g.query_radius(Vec2{}, 1.0).empty());
}

TEST_CASE("A huge covered square widens the cells instead of adding more") {
  SpatialGrid g(1.25e7, 40.0);
  REQUIRE(g.cells_per_side() <= SpatialGrid::kMaxCellsPerSide);
  REQUIRE(g.cell_size() * g.cells_per_side() >= 2.0 * 1.25e7);

  g.insert(actor_entity(0), Vec2{0.0, 0.0}, 20.0);
  g.insert(actor_entity(1), Vec2{30.0, 0.0}, 20.0);
  g.insert(actor_entity(1) + 5, Vec2{9.0e6, -9.0e6}, 20.0);
  REQUIRE(g.query_radius(Vec2{0.0, 0.0}, 20.0) == std::vector<EntityId>{0, 1});
  REQUIRE(contains(g.query_radius(Vec2{9.0e6, -9.0e6}, 1.0), 6));

  SpatialGrid small(100.0, 10.0);
  REQUIRE(small.cells_per_side() == 20);
  REQUIRE(small.cell_size() == 10.0);
}

TEST_CASE("Cell size covers the largest radius and step") {
  REQUIRE(SpatialGrid::cell_size_for(4.0, 20.0) == 20.0);
  REQUIRE(SpatialGrid::cell_size_for(4.0, 1.0) == 8.0);
  REQUIRE(SpatialGrid::cell_size_for(0.0, 0.0) == 1.0);
}

TEST_CASE("Entity id helpers separate actors from power-ups") {
  REQUIRE_FALSE(is_powerup_entity(actor_entity(1)));
  REQUIRE(is_powerup_entity(powerup_entity(0)));
  REQUIRE(powerup_slot_of(powerup_entity(5)) == 5);
}
