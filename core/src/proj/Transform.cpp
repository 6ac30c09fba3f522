#include "gc/proj/Transform.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/srs/transformation.hpp>

#include <cmath>
#include <cstdlib>
#include <limits>

namespace gc {

namespace bg = boost::geometry;

namespace {

using PlanePoint = bg::model::point<double, 2, bg::cs::cartesian>;

constexpr double kDegToRad = 0.017453292519943295;
constexpr double kRadToDeg = 57.29577951308232;

// PROJ signals unmappable points with HUGE_VAL instead of an error at times.
bool usable(double v) { return std::isfinite(v) && std::fabs(v) < 1e30; }

void setNaN(double& a, double& b) {
  a = std::numeric_limits<double>::quiet_NaN();
  b = std::numeric_limits<double>::quiet_NaN();
}

} // namespace

struct Transform::Impl {
  Impl(const std::string& source, const std::string& dest)
    : tr(bg::srs::proj4(source), bg::srs::proj4(dest)) {}

  bg::srs::transformation<> tr;
};

bool isGeographicDefinition(const std::string& definition) {
  static const char* names[] = {"longlat", "latlong", "lonlat", "latlon"};
  for (const char* n : names) {
    const std::string token = std::string("+proj=") + n;
    auto pos = definition.find(token);
    if (pos == std::string::npos) continue;
    const auto end = pos + token.size();
    if (end == definition.size() || definition[end] == ' ') return true;
  }
  return false;
}

double definitionParameter(const std::string& definition, const std::string& key,
                           double fallback) {
  const std::string token = "+" + key + "=";
  auto pos = definition.find(token);
  if (pos == std::string::npos) return fallback;
  const char* start = definition.c_str() + pos + token.size();
  char* end = nullptr;
  const double v = std::strtod(start, &end);
  if (end == start || !std::isfinite(v)) return fallback;
  return v;
}

std::shared_ptr<const Transform> Transform::create(const std::string& source,
                                                   const std::string& dest) {
  return std::shared_ptr<const Transform>(new Transform(source, dest));
}

Transform::Transform(const std::string& source, const std::string& dest)
  : source_(source), dest_(dest) {
  if (source.find_first_not_of(' ') == std::string::npos) {
    throw InvalidProjectionError("Transform: empty source definition");
  }
  if (dest.find_first_not_of(' ') == std::string::npos) {
    throw InvalidProjectionError("Transform: empty destination definition");
  }

  try {
    impl_ = std::make_unique<Impl>(source, dest);
  } catch (const std::exception& e) {
    throw InvalidProjectionError("Transform: cannot build '" + source + "' -> '" +
                                 dest + "': " + e.what());
  }

  geographicSource_ = isGeographicDefinition(source);
  geographicDest_ = isGeographicDefinition(dest);

  const double lon0 = definitionParameter(dest, "lon_0", 0.0);
  domain_.lonMin = lon0 - 180.0;
  domain_.lonMax = lon0 + 180.0;
}

Transform::~Transform() = default;

bool Transform::forward(double lon, double lat, double& x, double& y) const {
  if (!usable(lon) || !usable(lat)) {
    setNaN(x, y);
    return false;
  }

  const double k = geographicSource_ ? kDegToRad : 1.0;
  PlanePoint in(lon * k, lat * k);
  PlanePoint out(0.0, 0.0);
  if (!impl_->tr.forward(in, out)) {
    setNaN(x, y);
    return false;
  }

  const double s = geographicDest_ ? kRadToDeg : 1.0;
  x = bg::get<0>(out) * s;
  y = bg::get<1>(out) * s;
  if (!usable(x) || !usable(y)) {
    setNaN(x, y);
    return false;
  }
  return true;
}

bool Transform::inverse(double x, double y, double& lon, double& lat) const {
  if (!usable(x) || !usable(y)) {
    setNaN(lon, lat);
    return false;
  }

  const double k = geographicDest_ ? kDegToRad : 1.0;
  PlanePoint in(x * k, y * k);
  PlanePoint out(0.0, 0.0);
  if (!impl_->tr.inverse(in, out)) {
    setNaN(lon, lat);
    return false;
  }

  const double s = geographicSource_ ? kRadToDeg : 1.0;
  lon = bg::get<0>(out) * s;
  lat = bg::get<1>(out) * s;
  if (!usable(lon) || !usable(lat)) {
    setNaN(lon, lat);
    return false;
  }
  return true;
}

} // namespace gc
