// G1.1 — Transform + TransformHolder
// Tests:
//   1. longlat -> longlat is the identity in degrees
//   2. natearth forward/inverse round trip over the world
//   3. unmappable points return false and NaN
//   4. malformed definitions throw InvalidProjectionError
//   5. domain follows lon_0; definition helpers
//   6. TransformHolder versioning and listener notification

#include "gc/proj/Transform.hpp"
#include "gc/proj/TransformHolder.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (!(std::fabs(a - b) <= eps)) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

static const char* kWgs84 = "+proj=longlat +datum=WGS84";

int main() {
  // --- Test 1: identity ---
  {
    auto t = gc::Transform::create(kWgs84, kWgs84);
    requireTrue(t->isGeographicSource(), "source is geographic");
    requireTrue(t->isGeographicDest(), "dest is geographic");

    double x = 0, y = 0;
    requireTrue(t->forward(12.5, -33.25, x, y), "identity forward ok");
    requireNear(x, 12.5, 1e-9, "identity x");
    requireNear(y, -33.25, 1e-9, "identity y");

    double lon = 0, lat = 0;
    requireTrue(t->inverse(-170.0, 80.0, lon, lat), "identity inverse ok");
    requireNear(lon, -170.0, 1e-9, "identity inverse lon");
    requireNear(lat, 80.0, 1e-9, "identity inverse lat");

    std::printf("  Test 1 (identity): PASS\n");
  }

  // --- Test 2: natearth round trip ---
  {
    auto t = gc::Transform::create(kWgs84, "+proj=natearth");
    requireTrue(!t->isGeographicDest(), "natearth is projected");

    double x = 1, y = 1;
    requireTrue(t->forward(0.0, 0.0, x, y), "origin maps");
    requireNear(x, 0.0, 1e-6, "origin x");
    requireNear(y, 0.0, 1e-6, "origin y");

    requireTrue(t->forward(30.0, 45.0, x, y), "NE point maps");
    requireTrue(x > 0 && y > 0, "NE point lands in the NE quadrant");
    requireTrue(t->forward(-30.0, -45.0, x, y), "SW point maps");
    requireTrue(x < 0 && y < 0, "SW point lands in the SW quadrant");

    for (double lon = -170.0; lon <= 170.0; lon += 34.0) {
      for (double lat = -80.0; lat <= 80.0; lat += 20.0) {
        gc::GeoPoint plane, back;
        requireTrue(t->forward(gc::GeoPoint{lon, lat}, plane), "forward in domain");
        requireTrue(t->inverse(plane, back), "inverse in domain");
        requireNear(back.x, lon, 1e-6, "round trip lon");
        requireNear(back.y, lat, 1e-6, "round trip lat");
      }
    }
    std::printf("  Test 2 (natearth round trip): PASS\n");
  }

  // --- Test 3: unmappable points ---
  {
    auto t = gc::Transform::create(kWgs84, "+proj=merc");
    double x = 0, y = 0;
    requireTrue(!t->forward(0.0, 90.0, x, y), "merc pole fails");
    requireTrue(std::isnan(x) && std::isnan(y), "failure yields NaN");

    requireTrue(!t->forward(std::nan(""), 10.0, x, y), "NaN input fails");
    requireTrue(std::isnan(x), "NaN input yields NaN");

    gc::GeoPoint out;
    requireTrue(!t->forward(gc::kBreakPoint, out), "break point does not project");
    requireTrue(gc::isBreak(out), "break point stays a break");

    requireTrue(t->forward(10.0, 10.0, x, y), "merc regular point");
    requireTrue(std::isfinite(x) && std::isfinite(y), "merc finite output");
    std::printf("  Test 3 (unmappable points): PASS\n");
  }

  // --- Test 4: malformed definitions ---
  {
    const char* bad[][2] = {
      {kWgs84, "+proj=notaprojection"},
      {kWgs84, ""},
      {"   ", "+proj=natearth"},
      {kWgs84, "no projection here"},
    };
    for (const auto& def : bad) {
      bool threw = false;
      try {
        gc::Transform::create(def[0], def[1]);
      } catch (const gc::InvalidProjectionError&) {
        threw = true;
      }
      requireTrue(threw, "malformed definition throws InvalidProjectionError");
    }

    // InvalidProjectionError is a std::runtime_error
    bool caughtAsRuntime = false;
    try {
      gc::Transform::create(kWgs84, "+proj=notaprojection");
    } catch (const std::runtime_error& e) {
      caughtAsRuntime = std::string(e.what()).find("Transform") != std::string::npos;
    }
    requireTrue(caughtAsRuntime, "message names the component");
    std::printf("  Test 4 (malformed definitions): PASS\n");
  }

  // --- Test 5: domain + helpers ---
  {
    auto world = gc::Transform::create(kWgs84, "+proj=natearth");
    requireNear(world->domain().lonMin, -180.0, 1e-12, "default lonMin");
    requireNear(world->domain().lonMax, 180.0, 1e-12, "default lonMax");
    requireNear(world->domain().latMin, -90.0, 1e-12, "latMin");
    requireNear(world->domain().latMax, 90.0, 1e-12, "latMax");

    auto shifted = gc::Transform::create(kWgs84, "+proj=natearth +lon_0=90");
    requireNear(shifted->domain().lonMin, -90.0, 1e-12, "shifted lonMin");
    requireNear(shifted->domain().lonMax, 270.0, 1e-12, "shifted lonMax");

    requireTrue(gc::isGeographicDefinition("+proj=latlong +ellps=WGS84"), "latlong alias");
    requireTrue(!gc::isGeographicDefinition("+proj=longlatx"), "prefix is not a match");
    requireTrue(!gc::isGeographicDefinition("+proj=robin"), "robin is projected");

    requireNear(gc::definitionParameter("+proj=robin +lon_0=-30.5", "lon_0", 0.0), -30.5,
                1e-12, "lon_0 parsed");
    requireNear(gc::definitionParameter("+proj=robin", "lon_0", 7.0), 7.0, 1e-12,
                "missing parameter uses fallback");
    std::printf("  Test 5 (domain + helpers): PASS\n");
  }

  // --- Test 6: TransformHolder ---
  {
    bool threw = false;
    try {
      gc::TransformHolder bad(nullptr);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "null initial transform rejected");

    auto first = gc::Transform::create(kWgs84, "+proj=natearth");
    gc::TransformHolder holder(first);
    requireTrue(holder.version() == 0, "initial version 0");
    requireTrue(holder.get() == first, "holds initial transform");

    int calls = 0;
    std::shared_ptr<const gc::Transform> seen;
    const auto token = holder.subscribe([&](const std::shared_ptr<const gc::Transform>& t) {
      calls++;
      seen = t;
    });

    holder.set(first);
    requireTrue(calls == 0 && holder.version() == 0, "same pointer is a no-op");

    holder.set(kWgs84, "+proj=robin");
    requireTrue(calls == 1, "listener notified once");
    requireTrue(holder.version() == 1, "version bumped");
    requireTrue(seen == holder.get() && seen != first, "listener sees new transform");
    requireTrue(holder.get()->dest() == "+proj=robin", "dest recorded");

    bool badSet = false;
    try {
      holder.set(kWgs84, "+proj=notaprojection");
    } catch (const gc::InvalidProjectionError&) {
      badSet = true;
    }
    requireTrue(badSet, "bad set throws");
    requireTrue(holder.version() == 1 && calls == 1, "bad set leaves holder unchanged");
    requireTrue(holder.get()->dest() == "+proj=robin", "old transform kept");

    holder.unsubscribe(token);
    holder.set(first);
    requireTrue(calls == 1, "unsubscribed listener not called");
    requireTrue(holder.version() == 2, "version still counts");
    std::printf("  Test 6 (TransformHolder): PASS\n");
  }

  std::printf("G1.1 transform PASS\n");
  return 0;
}
