#include "pz/transform/ZoomConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdio>

namespace pz {

namespace {

const char* kFitNatural = "fit-natural";

bool readNumber(const rapidjson::Value& obj, const char* key, double& out, std::string& bad) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber()) { bad = key; return false; }
  out = it->value.GetDouble();
  return true;
}

bool readInt(const rapidjson::Value& obj, const char* key, int& out, std::string& bad) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsInt()) { bad = key; return false; }
  out = it->value.GetInt();
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& out, std::string& bad) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsBool()) { bad = key; return false; }
  out = it->value.GetBool();
  return true;
}

bool positiveFinite(double v) {
  return std::isfinite(v) && v > 0.0;
}

} // namespace

ZoomResult validateZoomConfig(const ZoomConfig& cfg) {
  // Rest scale 1 has to be reachable: minScale <= 1 <= maxScale.
  if (!std::isfinite(cfg.minScale) || cfg.minScale < 0.0 || cfg.minScale > 1.0)
    return makeError("INVALID_CONFIG", "minScale must be in [0, 1]");
  if (!std::isfinite(cfg.defaultMaxScale) || cfg.defaultMaxScale < 1.0)
    return makeError("INVALID_CONFIG", "defaultMaxScale must be >= 1");
  if (cfg.maxScaleMode == MaxScaleMode::Fixed &&
      (!std::isfinite(cfg.maxScale) || cfg.maxScale < 1.0))
    return makeError("INVALID_CONFIG", "maxScale must be >= 1");
  if (!positiveFinite(cfg.minScaleForPan))
    return makeError("INVALID_CONFIG", "minScaleForPan must be > 0");
  if (!positiveFinite(cfg.doubleTapScale))
    return makeError("INVALID_CONFIG", "doubleTapScale must be > 0");
  if (!positiveFinite(cfg.wheelStep))
    return makeError("INVALID_CONFIG", "wheelStep must be > 0");
  if (!std::isfinite(cfg.stepZoomScale) || cfg.stepZoomScale < 0.0)
    return makeError("INVALID_CONFIG", "stepZoomScale must be >= 0");
  if (!positiveFinite(cfg.clickToZoomScale))
    return makeError("INVALID_CONFIG", "clickToZoomScale must be > 0");
  if (cfg.doubleTapWindowMs < 0.0 || cfg.doubleTapMaxOffsetPx < 0.0 || cfg.moveThresholdPx < 0.0)
    return makeError("INVALID_CONFIG", "gesture thresholds must be >= 0");
  if (cfg.transitionDurationMs < 0)
    return makeError("INVALID_CONFIG", "transitionDurationMs must be >= 0");
  if (cfg.naturalPollIntervalMs <= 0)
    return makeError("INVALID_CONFIG", "naturalPollIntervalMs must be > 0");
  return makeOk(1.0);
}

ZoomResult parseZoomConfig(const std::string& json, ZoomConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject())
    return makeError("CONFIG_PARSE", "ZoomConfig: invalid JSON object");

  ZoomConfig cfg = out;
  std::string bad;
  bool ok = readNumber(doc, "minScale", cfg.minScale, bad) &&
            readNumber(doc, "defaultMaxScale", cfg.defaultMaxScale, bad) &&
            readBool(doc, "panEnabled", cfg.panEnabled, bad) &&
            readBool(doc, "panClampEnabled", cfg.panClampEnabled, bad) &&
            readNumber(doc, "minScaleForPan", cfg.minScaleForPan, bad) &&
            readBool(doc, "doubleTapEnabled", cfg.doubleTapEnabled, bad) &&
            readNumber(doc, "doubleTapScale", cfg.doubleTapScale, bad) &&
            readNumber(doc, "doubleTapWindowMs", cfg.doubleTapWindowMs, bad) &&
            readNumber(doc, "doubleTapMaxOffsetPx", cfg.doubleTapMaxOffsetPx, bad) &&
            readNumber(doc, "moveThresholdPx", cfg.moveThresholdPx, bad) &&
            readBool(doc, "wheelEnabled", cfg.wheelEnabled, bad) &&
            readNumber(doc, "wheelStep", cfg.wheelStep, bad) &&
            readBool(doc, "draggableOnPinch", cfg.draggableOnPinch, bad) &&
            readNumber(doc, "stepZoomScale", cfg.stepZoomScale, bad) &&
            readBool(doc, "autoZoomOut", cfg.autoZoomOut, bad) &&
            readBool(doc, "clickToZoomEnabled", cfg.clickToZoomEnabled, bad) &&
            readNumber(doc, "clickToZoomScale", cfg.clickToZoomScale, bad) &&
            readInt(doc, "transitionDurationMs", cfg.transitionDurationMs, bad) &&
            readInt(doc, "naturalPollIntervalMs", cfg.naturalPollIntervalMs, bad);
  if (!ok)
    return makeError("CONFIG_PARSE", "ZoomConfig: wrong type for field: " + bad);

  auto it = doc.FindMember("maxScale");
  if (it != doc.MemberEnd()) {
    if (it->value.IsNumber()) {
      cfg.maxScaleMode = MaxScaleMode::Fixed;
      cfg.maxScale = it->value.GetDouble();
    } else if (it->value.IsString() && std::string(it->value.GetString()) == kFitNatural) {
      cfg.maxScaleMode = MaxScaleMode::FitNatural;
    } else {
      return makeError("CONFIG_PARSE",
                       "ZoomConfig: maxScale must be a number or \"fit-natural\"");
    }
  }

  ZoomResult v = validateZoomConfig(cfg);
  if (!v.ok) {
    std::fprintf(stderr, "ZoomConfig: rejected: %s\n", v.err.message.c_str());
    return v;
  }

  out = cfg;
  return makeOk(1.0);
}

std::string serializeZoomConfig(const ZoomConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("minScale", cfg.minScale, alloc);
  if (cfg.maxScaleMode == MaxScaleMode::Fixed) {
    doc.AddMember("maxScale", cfg.maxScale, alloc);
  } else {
    doc.AddMember("maxScale", rapidjson::StringRef(kFitNatural), alloc);
  }
  doc.AddMember("defaultMaxScale", cfg.defaultMaxScale, alloc);
  doc.AddMember("panEnabled", cfg.panEnabled, alloc);
  doc.AddMember("panClampEnabled", cfg.panClampEnabled, alloc);
  doc.AddMember("minScaleForPan", cfg.minScaleForPan, alloc);
  doc.AddMember("doubleTapEnabled", cfg.doubleTapEnabled, alloc);
  doc.AddMember("doubleTapScale", cfg.doubleTapScale, alloc);
  doc.AddMember("doubleTapWindowMs", cfg.doubleTapWindowMs, alloc);
  doc.AddMember("doubleTapMaxOffsetPx", cfg.doubleTapMaxOffsetPx, alloc);
  doc.AddMember("moveThresholdPx", cfg.moveThresholdPx, alloc);
  doc.AddMember("wheelEnabled", cfg.wheelEnabled, alloc);
  doc.AddMember("wheelStep", cfg.wheelStep, alloc);
  doc.AddMember("draggableOnPinch", cfg.draggableOnPinch, alloc);
  doc.AddMember("stepZoomScale", cfg.stepZoomScale, alloc);
  doc.AddMember("autoZoomOut", cfg.autoZoomOut, alloc);
  doc.AddMember("clickToZoomEnabled", cfg.clickToZoomEnabled, alloc);
  doc.AddMember("clickToZoomScale", cfg.clickToZoomScale, alloc);
  doc.AddMember("transitionDurationMs", cfg.transitionDurationMs, alloc);
  doc.AddMember("naturalPollIntervalMs", cfg.naturalPollIntervalMs, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace pz
