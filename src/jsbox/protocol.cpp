#include <jsbox/protocol.h>

#include <nlohmann/json.hpp>
#include <jsbox/utils.h>

const char kEnvelopeMarker[] = "__sandbox";

namespace {

inline void SetReason(DropReason* reason, DropReason val) {
  if (reason) *reason = val;
}

std::string ArgToString(const nlohmann::json& val) {
  if (val.is_string()) return val.get<std::string>();
  return val.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

std::optional<Envelope> ParseEnvelope(const std::string& line, DropReason* reason) {
  nlohmann::json obj;
  try {
    obj = nlohmann::json::parse(line);
  } catch (nlohmann::json::exception&) {
    SetReason(reason, DropReason::MALFORMED);
    return std::nullopt;
  }
  if (!obj.is_object()) {
    SetReason(reason, DropReason::MALFORMED);
    return std::nullopt;
  }
  Envelope ret;
  if (auto it = obj.find(kEnvelopeMarker); it != obj.end() && it->is_boolean()) {
    ret.authentic = it->get<bool>();
  }
  // a non-string secret stays empty and thus never matches an active run
  if (auto it = obj.find("secret"); it != obj.end() && it->is_string()) {
    ret.secret = it->get<std::string>();
  }
  if (auto it = obj.find("type"); it != obj.end()) {
    if (!it->is_string() || !GetMessageKind(it->get<std::string>(), &ret.kind)) {
      SetReason(reason, DropReason::UNKNOWN_KIND);
      return std::nullopt;
    }
  }
  if (auto it = obj.find("args"); it != obj.end() && !it->is_null()) {
    if (it->is_array()) {
      for (auto& i : *it) ret.args.push_back(ArgToString(i));
    } else {
      ret.args.push_back(ArgToString(*it));
    }
  }
  return ret;
}

std::string SerializeEnvelope(const Envelope& env) {
  nlohmann::json obj = {
    {kEnvelopeMarker, env.authentic},
    {"secret", env.secret},
    {"type", MessageKindName(env.kind)},
    {"args", env.args},
  };
  return obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
