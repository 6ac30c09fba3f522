#include "gc/ingest/IngestProcessor.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace gc {

const std::uint8_t* IngestProcessor::getBufferData(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return nullptr;
  return it->second.data.data();
}

std::uint32_t IngestProcessor::getBufferSize(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return 0;
  return static_cast<std::uint32_t>(it->second.data.size());
}

void IngestProcessor::ensureBuffer(Id id) {
  if (buffers_.find(id) == buffers_.end()) {
    CpuBuffer b;
    b.id = id;
    buffers_[id] = std::move(b);
  }
}

void IngestProcessor::setBufferData(Id id, const std::uint8_t* data, std::uint32_t len) {
  ensureBuffer(id);
  CpuBuffer& buf = buffers_[id];
  if (len > buf.maxBytes) {
    throw std::length_error("IngestProcessor: payload of " + std::to_string(len) +
                            " bytes exceeds capacity of buffer " + idStr(id));
  }
  buf.data.assign(data, data + len);
}

void IngestProcessor::setBufferFloats(Id id, const std::vector<float>& values) {
  const auto len = static_cast<std::uint32_t>(values.size() * sizeof(float));
  setBufferData(id, reinterpret_cast<const std::uint8_t*>(values.data()), len);
}

std::vector<float> IngestProcessor::getBufferFloats(Id id) const {
  std::vector<float> out(getBufferSize(id) / sizeof(float));
  if (!out.empty()) std::memcpy(out.data(), getBufferData(id), out.size() * sizeof(float));
  return out;
}

bool IngestProcessor::releaseBuffer(Id id) {
  return buffers_.erase(id) > 0;
}

void IngestProcessor::setMaxBytes(Id id, std::uint32_t maxBytes) {
  ensureBuffer(id);
  CpuBuffer& buf = buffers_[id];
  buf.maxBytes = maxBytes;
  if (buf.data.size() > maxBytes) buf.data.resize(maxBytes);
}

std::uint32_t IngestProcessor::getMaxBytes(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return DEFAULT_MAX_BYTES;
  return it->second.maxBytes;
}

void IngestProcessor::syncBufferLengths(Scene& scene) const {
  for (const auto& [id, buf] : buffers_) {
    if (Buffer* b = scene.getBufferMutable(id)) {
      b->byteLength = static_cast<std::uint32_t>(buf.data.size());
    }
  }
}

} // namespace gc
