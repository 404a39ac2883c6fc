#include <catch2/catch.hpp>

#include <ringout/snap_buffer.hpp>

using namespace ringout;

TEST_CASE("LatestBuffer hands out only the newest value, once") {
  LatestBuffer<int> buf;
  std::uint64_t cursor = 0;
  int out = -1;
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));

  buf.publish(1);
  buf.publish(2);
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out == 2);
  REQUIRE(cursor == buf.sequence());
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));

  buf.publish(3);
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out == 3);
}

TEST_CASE("SnapshotBuffer copies the published arena state") {
  SnapshotBuffer buf;
  ArenaSnapshot s{};
  s.tick = 42;
  s.actors.push_back(ActorPose{});
  buf.publish(s);

  std::uint64_t cursor = 0;
  ArenaSnapshot out{};
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out.tick == 42);
  REQUIRE(out.actors.size() == 1);
}

TEST_CASE("EventQueue drops the oldest events when full") {
  EventQueue q(2);
  EventList ev(3);
  for (std::size_t i = 0; i < ev.size(); ++i) ev[i].tick = i;
  q.push_all(ev);
  REQUIRE(q.dropped() == 1);

  const EventList out = q.drain();
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].tick == 1);
  REQUIRE(out[1].tick == 2);
  REQUIRE(q.drain().empty());

  q.push_all(ev);
  q.clear();
  REQUIRE(q.drain().empty());
}
