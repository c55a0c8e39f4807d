#include "pz/transform/StateSnapshot.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace pz {

std::string serializeTransformState(const ExtendedTransformState& state) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("scale", state.scale, alloc);
  doc.AddMember("translateX", state.translateX, alloc);
  doc.AddMember("translateY", state.translateY, alloc);

  rapidjson::Value flags(rapidjson::kObjectType);
  flags.AddMember("isZoomedIn", state.isZoomedIn, alloc);
  flags.AddMember("atMaxScale", state.atMaxScale, alloc);
  flags.AddMember("atMinScale", state.atMinScale, alloc);
  flags.AddMember("canZoomIn", state.canZoomIn, alloc);
  flags.AddMember("canZoomOut", state.canZoomOut, alloc);
  doc.AddMember("flags", flags, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

ZoomResult deserializeTransformState(const std::string& json, ExtendedTransformState& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject())
    return makeError("STATE_PARSE", "TransformState: invalid JSON object");

  if (!doc.HasMember("scale") || !doc["scale"].IsNumber())
    return makeError("STATE_PARSE", "TransformState: missing numeric field: scale");
  double scale = doc["scale"].GetDouble();
  if (scale <= 0.0)
    return makeError("STATE_PARSE", "TransformState: scale must be > 0");

  ExtendedTransformState s;
  s.scale = scale;
  if (doc.HasMember("translateX") && doc["translateX"].IsNumber())
    s.translateX = doc["translateX"].GetDouble();
  if (doc.HasMember("translateY") && doc["translateY"].IsNumber())
    s.translateY = doc["translateY"].GetDouble();

  out = s;
  return makeOk(scale);
}

} // namespace pz
