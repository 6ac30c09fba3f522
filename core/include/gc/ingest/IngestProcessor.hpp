#pragma once
#include "gc/ids/Id.hpp"
#include "gc/scene/Scene.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace gc {

// CPU-side vertex storage keyed by buffer id. Scene buffers only carry the
// byte length; the bytes live here until a back-end uploads them.
class IngestProcessor {
public:
  const std::uint8_t* getBufferData(Id id) const;
  std::uint32_t getBufferSize(Id id) const;

  void ensureBuffer(Id id);
  void setBufferData(Id id, const std::uint8_t* data, std::uint32_t len);
  void setBufferFloats(Id id, const std::vector<float>& values);
  std::vector<float> getBufferFloats(Id id) const;
  bool releaseBuffer(Id id);

  // Byte capacity per buffer; setBufferData rejects larger payloads.
  void setMaxBytes(Id id, std::uint32_t maxBytes);
  std::uint32_t getMaxBytes(Id id) const;

  // Copy current CPU sizes into Scene::Buffer::byteLength.
  void syncBufferLengths(Scene& scene) const;

  static constexpr std::uint32_t DEFAULT_MAX_BYTES = 16 * 1024 * 1024;

private:
  struct CpuBuffer {
    Id id{0};
    std::vector<std::uint8_t> data;
    std::uint32_t maxBytes{DEFAULT_MAX_BYTES};
  };

  std::unordered_map<Id, CpuBuffer> buffers_;
};

} // namespace gc
