#include "rng/StateFile.hpp"

#include <cinttypes>
#include <cstdio>
#include <fstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Log.hpp"
#include "rng/EnhancedRandom.hpp"

using json = nlohmann::json;

namespace rng {

namespace {

std::string FormatWord(const uint64_t word) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "0x%016" PRIX64, word);
  return std::string(buf);
}

// Words may be hex strings or plain JSON unsigned integers.
bool ReadWord(const json &value, uint64_t &out) {
  if (value.is_number_unsigned()) {
    out = value.get<uint64_t>();
    return true;
  }
  if (value.is_string()) {
    return ParseStateWord(value.get<std::string>(), out);
  }
  return false;
}

bool ApplyDocument(EnhancedRandom &rng, const json &data) {
  if (!data.is_object()) {
    LOG_ERROR("State document is not a JSON object");
    return false;
  }
  const std::string expectedTag = rng.DefaultTag();
  const std::string tag = data.value("tag", std::string());
  if (tag != expectedTag) {
    LOG_ERROR("State tag '{}' does not match generator tag '{}'", tag,
              expectedTag);
    return false;
  }
  if (!data.contains("states") || !data["states"].is_array()) {
    LOG_ERROR("State document for {} has no 'states' array", expectedTag);
    return false;
  }

  const json &words = data["states"];
  const int count = rng.StateCount();
  if (static_cast<int>(words.size()) != count) {
    LOG_ERROR("State document for {} has {} words, expected {}", expectedTag,
              words.size(), count);
    return false;
  }

  std::vector<uint64_t> states(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    if (!ReadWord(words[static_cast<std::size_t>(i)],
                  states[static_cast<std::size_t>(i)])) {
      LOG_ERROR("State word #{} for {} is not a valid 64-bit value", i,
                expectedTag);
      return false;
    }
  }

  for (int i = 0; i < count; ++i) {
    rng.SetSelectedState(i, states[static_cast<std::size_t>(i)]);
  }
  return true;
}

} // namespace

std::string StateToJson(const EnhancedRandom &rng) {
  json data;
  data["tag"] = rng.DefaultTag();
  data["states"] = json::array();
  for (int i = 0; i < rng.StateCount(); ++i) {
    data["states"].push_back(FormatWord(rng.SelectState(i)));
  }
  return data.dump(2);
}

bool StateFromJson(EnhancedRandom &rng, const std::string &text) {
  try {
    return ApplyDocument(rng, json::parse(text));
  } catch (const json::parse_error &e) {
    LOG_ERROR("JSON parse error in state text: {}", e.what());
    return false;
  } catch (const json::exception &e) {
    LOG_ERROR("Malformed state text: {}", e.what());
    return false;
  }
}

bool SaveStateToFile(const EnhancedRandom &rng, const char *path) {
  std::ofstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open state file for writing: {}", path);
    return false;
  }
  f << StateToJson(rng) << '\n';
  if (!f) {
    LOG_ERROR("Failed to write state file: {}", path);
    return false;
  }
  return true;
}

bool LoadStateFromFile(EnhancedRandom &rng, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open state file: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);
    return ApplyDocument(rng, data);
  } catch (const json::parse_error &e) {
    LOG_ERROR("JSON parse error in {}: {}", path, e.what());
    return false;
  } catch (const json::exception &e) {
    LOG_ERROR("Malformed state file {}: {}", path, e.what());
    return false;
  }
}

} // namespace rng
