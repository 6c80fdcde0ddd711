#pragma once

#include <string>
#include <vector>

namespace vault_core {

// Converts query text into a vector of the collection's dimension. Supplied by
// the caller; the engine never embeds text itself.
class QueryEmbedder {
 public:
  virtual ~QueryEmbedder() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;
  virtual std::string model_id() const = 0;
};

}  // namespace vault_core
