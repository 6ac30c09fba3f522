#pragma once
#include "gc/geo/GeoTypes.hpp"
#include <string>

namespace gc {

// Reads every LineString, MultiLineString, Polygon and MultiPolygon in a
// GeoJSON document (FeatureCollection, Feature, GeometryCollection or bare
// geometry) into one flat lon/lat sequence, lines separated by kBreakPoint.
// Points and unknown types are skipped. Appends to `out`; returns false on a
// parse error or malformed coordinates.
bool loadGeoJsonLines(const std::string& json, GeoLine& out);

bool loadGeoJsonLinesFile(const std::string& path, GeoLine& out);

} // namespace gc
