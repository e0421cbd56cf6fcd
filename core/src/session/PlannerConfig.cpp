#include "tp/session/PlannerConfig.hpp"

#include <algorithm>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace tp {

bool parsePlannerConfig(const std::string& json, PlannerConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  PlannerConfig cfg = out;

  // Invoker
  if (doc.HasMember("invoker") && doc["invoker"].IsObject()) {
    const auto& inv = doc["invoker"];
    if (inv.HasMember("maxHistory") && inv["maxHistory"].IsUint64())
      cfg.invoker.maxHistory = static_cast<std::size_t>(inv["maxHistory"].GetUint64());
    if (inv.HasMember("verbose") && inv["verbose"].IsBool())
      cfg.invoker.verbose = inv["verbose"].GetBool();
  }

  // Store
  if (doc.HasMember("store") && doc["store"].IsObject()) {
    const auto& st = doc["store"];
    if (st.HasMember("shareCodeLength") && st["shareCodeLength"].IsUint64())
      cfg.store.shareCodeLength = static_cast<std::size_t>(
        std::clamp<std::uint64_t>(st["shareCodeLength"].GetUint64(),
                                  TripStoreConfig::kMinShareCodeLength,
                                  TripStoreConfig::kMaxShareCodeLength));
    if (st.HasMember("shareCodeSeed") && st["shareCodeSeed"].IsUint())
      cfg.store.shareCodeSeed = st["shareCodeSeed"].GetUint();
  }

  if (doc.HasMember("snapshotPath") && doc["snapshotPath"].IsString())
    cfg.snapshotPath = doc["snapshotPath"].GetString();

  out = cfg;
  return true;
}

std::string serializePlannerConfig(const PlannerConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value inv(rapidjson::kObjectType);
  inv.AddMember("maxHistory", static_cast<std::uint64_t>(config.invoker.maxHistory), alloc);
  inv.AddMember("verbose", config.invoker.verbose, alloc);
  doc.AddMember("invoker", inv, alloc);

  rapidjson::Value st(rapidjson::kObjectType);
  st.AddMember("shareCodeLength", static_cast<std::uint64_t>(config.store.shareCodeLength), alloc);
  st.AddMember("shareCodeSeed", config.store.shareCodeSeed, alloc);
  doc.AddMember("store", st, alloc);

  doc.AddMember("snapshotPath",
                rapidjson::Value(config.snapshotPath.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace tp
