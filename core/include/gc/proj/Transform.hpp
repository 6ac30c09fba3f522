#pragma once
#include "gc/geo/GeoTypes.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace gc {

// Unknown or malformed projection definition.
class InvalidProjectionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Lon/lat region a transform is defined on, in degrees.
struct GeoDomain {
  double lonMin{-180}, lonMax{180};
  double latMin{-90}, latMax{90};
};

// Forward mapping (lon, lat) in degrees -> projected plane (x, y), plus its
// inverse, built from PROJ.4-style source and destination definitions and
// evaluated with Boost.Geometry SRS.
//
// A geographic destination (+proj=longlat and aliases) yields degrees, so
// "+proj=longlat" -> "+proj=longlat" is the identity.
class Transform {
public:
  // Throws InvalidProjectionError if either definition is rejected.
  static std::shared_ptr<const Transform> create(const std::string& source,
                                                 const std::string& dest);
  ~Transform();

  Transform(const Transform&) = delete;
  Transform& operator=(const Transform&) = delete;

  // False (and NaN output) when the point cannot be mapped.
  bool forward(double lon, double lat, double& x, double& y) const;
  bool inverse(double x, double y, double& lon, double& lat) const;

  bool forward(const GeoPoint& in, GeoPoint& out) const { return forward(in.x, in.y, out.x, out.y); }
  bool inverse(const GeoPoint& in, GeoPoint& out) const { return inverse(in.x, in.y, out.x, out.y); }

  const std::string& source() const { return source_; }
  const std::string& dest() const { return dest_; }

  // Longitude [lon_0 - 180, lon_0 + 180] of the destination, latitude [-90, 90].
  const GeoDomain& domain() const { return domain_; }

  bool isGeographicSource() const { return geographicSource_; }
  bool isGeographicDest() const { return geographicDest_; }

private:
  struct Impl;

  Transform(const std::string& source, const std::string& dest);

  std::string source_;
  std::string dest_;
  GeoDomain domain_;
  bool geographicSource_{false};
  bool geographicDest_{false};
  std::unique_ptr<Impl> impl_;
};

// True for +proj=longlat / latlong / lonlat / latlon.
bool isGeographicDefinition(const std::string& definition);

// Numeric value of "+key=" in a definition, or `fallback`.
double definitionParameter(const std::string& definition, const std::string& key,
                           double fallback);

} // namespace gc
