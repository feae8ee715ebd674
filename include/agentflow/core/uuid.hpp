#pragma once

#include <random>
#include <string>

namespace agentflow {

// Random identifiers. Generators are thread_local: run ids are minted
// concurrently by every process_async caller.
class UUID {
 public:
  // Short run identifier, e.g. "run-3f9a0c2e"
  static std::string run_id() {
    static const char charset[] = "0123456789abcdef";
    auto& gen = engine();
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result = "run-";
    for (int i = 0; i < 8; ++i) {
      result += charset[dist(gen)];
    }
    return result;
  }

 private:
  static std::mt19937_64& engine() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    return gen;
  }
};

}  // namespace agentflow
