#include "gc/scene/Scene.hpp"
#include <algorithm>

namespace gc {

namespace {

template <typename Map>
auto findIn(Map& m, Id id) -> decltype(&m.begin()->second) {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

template <typename Map>
std::vector<Id> sortedKeys(const Map& m) {
  std::vector<Id> out;
  out.reserve(m.size());
  for (const auto& kv : m) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

bool Scene::hasPane(Id id) const     { return panes_.count(id) != 0; }
bool Scene::hasLayer(Id id) const    { return layers_.count(id) != 0; }
bool Scene::hasDrawItem(Id id) const { return drawItems_.count(id) != 0; }
bool Scene::hasBuffer(Id id) const   { return buffers_.count(id) != 0; }
bool Scene::hasGeometry(Id id) const { return geometries_.count(id) != 0; }

const Pane* Scene::getPane(Id id) const         { return findIn(panes_, id); }
const Layer* Scene::getLayer(Id id) const       { return findIn(layers_, id); }
const DrawItem* Scene::getDrawItem(Id id) const { return findIn(drawItems_, id); }
const Buffer* Scene::getBuffer(Id id) const     { return findIn(buffers_, id); }
const Geometry* Scene::getGeometry(Id id) const { return findIn(geometries_, id); }

DrawItem* Scene::getDrawItemMutable(Id id) { return findIn(drawItems_, id); }
Buffer* Scene::getBufferMutable(Id id)     { return findIn(buffers_, id); }
Geometry* Scene::getGeometryMutable(Id id) { return findIn(geometries_, id); }

void Scene::addPane(Pane p)         { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)       { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d) { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)     { buffers_[b.id] = std::move(b); }
void Scene::addGeometry(Geometry g) { geometries_[g.id] = std::move(g); }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) {
  if (drawItems_.erase(drawItemId) == 0) return {};
  return {drawItemId};
}

std::vector<Id> Scene::deleteLayer(Id layerId) {
  if (!hasLayer(layerId)) return {};

  std::vector<Id> deleted{layerId};
  for (Id id : drawItemsOfLayer(layerId)) {
    drawItems_.erase(id);
    deleted.push_back(id);
  }
  layers_.erase(layerId);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  if (!hasPane(paneId)) return {};

  std::vector<Id> deleted{paneId};
  for (Id lid : layerIds()) {
    if (layers_[lid].paneId != paneId) continue;
    auto layerDeleted = deleteLayer(lid);
    deleted.insert(deleted.end(), layerDeleted.begin(), layerDeleted.end());
  }
  panes_.erase(paneId);
  return deleted;
}

std::vector<Id> Scene::deleteBuffer(Id bufferId) {
  if (buffers_.erase(bufferId) == 0) return {};
  return {bufferId};
}

std::vector<Id> Scene::deleteGeometry(Id geometryId) {
  if (geometries_.erase(geometryId) == 0) return {};
  return {geometryId};
}

std::vector<Id> Scene::paneIds() const     { return sortedKeys(panes_); }
std::vector<Id> Scene::layerIds() const    { return sortedKeys(layers_); }
std::vector<Id> Scene::drawItemIds() const { return sortedKeys(drawItems_); }
std::vector<Id> Scene::bufferIds() const   { return sortedKeys(buffers_); }
std::vector<Id> Scene::geometryIds() const { return sortedKeys(geometries_); }

std::vector<Id> Scene::drawItemsOfLayer(Id layerId) const {
  std::vector<Id> out;
  for (const auto& kv : drawItems_) {
    if (kv.second.layerId == layerId) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace gc
