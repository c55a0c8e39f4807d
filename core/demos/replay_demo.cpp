// Gesture replay for pinch-zoom
// Reads newline-delimited JSON commands from stdin (or the file named by the
// first argument), drives a PinchZoom through an InputHub and prints every
// transform update to stdout. Blank lines are skipped.
//
//   {"cmd":"init","config":{...},"container":[0,0,800,600],"content":[800,600],"natural":[1600,1200]}
//   {"cmd":"touch","type":"down|move|up","id":1,"x":100,"y":100,"t":0,"device":"touch|mouse"}
//   {"cmd":"wheel","x":400,"y":300,"dy":-100,"t":0}
//   {"cmd":"zoomIn","step":0.5}   {"cmd":"zoomOut","step":0.5}
//   {"cmd":"toggle"}  {"cmd":"reset"}  {"cmd":"zoomToPoint","x":10,"y":10,"scale":2}
//   {"cmd":"tick","ms":10}  {"cmd":"resize","container":[0,0,400,300]}
//   {"cmd":"natural","w":1600,"h":1200}  {"cmd":"redetect"}  {"cmd":"state"}  {"cmd":"teardown"}

#include "pz/geometry/StaticGeometry.hpp"
#include "pz/input/InputSource.hpp"
#include "pz/sched/ManualScheduler.hpp"
#include "pz/session/PinchZoom.hpp"
#include "pz/transform/ZoomConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// False once the input is exhausted; an empty line is not the end.
static bool readLine(std::FILE* in, std::string& line) {
  line.clear();
  int c;
  while ((c = std::fgetc(in)) != EOF && c != '\n') {
    line += static_cast<char>(c);
  }
  return c != EOF || !line.empty();
}

static double num(const rapidjson::Value& v, const char* key, double fallback) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd() || !it->value.IsNumber()) return fallback;
  return it->value.GetDouble();
}

// Reads [a, b, ...] into out; false unless the array has exactly n numbers.
static bool readArray(const rapidjson::Value& v, const char* key, double* out, unsigned n) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd() || !it->value.IsArray() || it->value.Size() != n) return false;
  for (unsigned i = 0; i < n; i++) {
    if (!it->value[i].IsNumber()) return false;
    out[i] = it->value[i].GetDouble();
  }
  return true;
}

static void printResult(const char* op, const pz::ZoomResult& r) {
  if (!r.ok) {
    std::fprintf(stderr, "replay: %s failed: [%s] %s\n", op,
                 r.err.code.c_str(), r.err.message.c_str());
  }
}

// ---------------------------------------------------------------------------
// Contact tracking: the script sends one finger at a time, the classifier
// wants the full list of contacts that are down.
// ---------------------------------------------------------------------------

struct ContactTable {
  std::vector<pz::Contact> down;

  void upsert(const pz::Contact& c) {
    for (auto& d : down) {
      if (d.id == c.id) { d = c; return; }
    }
    down.push_back(c);
  }

  void remove(int id) {
    down.erase(std::remove_if(down.begin(), down.end(),
                              [id](const pz::Contact& c) { return c.id == id; }),
               down.end());
  }
};

int main(int argc, char** argv) {
  std::FILE* in = stdin;
  if (argc > 1) {
    in = std::fopen(argv[1], "r");
    if (!in) {
      std::fprintf(stderr, "replay: cannot open %s\n", argv[1]);
      return 1;
    }
  }

  pz::StaticGeometry geometry(0, 0, 800, 600);
  pz::ManualScheduler scheduler;
  pz::InputHub hub;
  pz::PinchZoom zoom;
  ContactTable contacts;

  zoom.channel().subscribe([](const pz::TransformUpdate& u) {
    std::printf("UPDATE %s scale=%.4f tx=%.2f ty=%.2f%s\n",
                pz::toString(u.reason), u.scale, u.translateX, u.translateY,
                u.animate ? " animate" : "");
    std::fflush(stdout);
  });

  std::string line;
  while (readLine(in, line)) {
    if (line.empty() || line == "\r") continue;

    rapidjson::Document doc;
    doc.Parse(line.c_str());
    if (doc.HasParseError() || !doc.IsObject()) continue;
    if (!doc.HasMember("cmd") || !doc["cmd"].IsString()) continue;

    std::string cmd = doc["cmd"].GetString();

    if (cmd == "init") {
      pz::ZoomConfig cfg;
      auto it = doc.FindMember("config");
      if (it != doc.MemberEnd()) {
        rapidjson::StringBuffer sb;
        rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
        it->value.Accept(writer);
        pz::ZoomResult pr = pz::parseZoomConfig(sb.GetString(), cfg);
        if (!pr.ok) {
          printResult("init", pr);
          continue;
        }
      }

      double rect[4];
      if (readArray(doc, "container", rect, 4)) {
        geometry.setContainerRect(pz::Rect{rect[0], rect[1], rect[2], rect[3]});
        geometry.setElementSize(rect[2], rect[3]);
        geometry.setContentSize(rect[2], rect[3]);
      }
      double size[2];
      if (readArray(doc, "element", size, 2)) geometry.setElementSize(size[0], size[1]);
      if (readArray(doc, "content", size, 2)) geometry.setContentSize(size[0], size[1]);
      if (readArray(doc, "natural", size, 2)) geometry.setNaturalSize(size[0], size[1]);

      contacts.down.clear();
      printResult("init", zoom.init(cfg, &geometry, &scheduler, &hub));
    }
    else if (cmd == "touch") {
      std::string type = doc.HasMember("type") && doc["type"].IsString()
                             ? doc["type"].GetString() : "";
      pz::PointerEvent ev;
      ev.timeMs = num(doc, "t", scheduler.nowMs());
      ev.changed = pz::Contact{static_cast<int>(num(doc, "id", 0)),
                               num(doc, "x", 0), num(doc, "y", 0)};
      if (doc.HasMember("device") && doc["device"].IsString() &&
          std::string(doc["device"].GetString()) == "mouse") {
        ev.device = pz::PointerDevice::Mouse;
      }

      if (type == "down") {
        contacts.upsert(ev.changed);
        ev.contacts = contacts.down;
        hub.press(ev);
      } else if (type == "move") {
        contacts.upsert(ev.changed);
        ev.contacts = contacts.down;
        hub.move(ev);
      } else if (type == "up") {
        contacts.remove(ev.changed.id);
        ev.contacts = contacts.down;
        hub.release(ev);
      }
    }
    else if (cmd == "wheel") {
      pz::WheelEvent w;
      w.x = num(doc, "x", 0);
      w.y = num(doc, "y", 0);
      w.deltaY = num(doc, "dy", 0);
      w.timeMs = num(doc, "t", scheduler.nowMs());
      hub.wheel(w);
    }
    else if (cmd == "zoomIn") {
      printResult("zoomIn", zoom.zoomIn(num(doc, "step", 0.5)));
    }
    else if (cmd == "zoomOut") {
      printResult("zoomOut", zoom.zoomOut(num(doc, "step", 0.5)));
    }
    else if (cmd == "toggle") {
      printResult("toggle", zoom.toggleZoom());
    }
    else if (cmd == "reset") {
      printResult("reset", zoom.resetZoom());
    }
    else if (cmd == "zoomToPoint") {
      printResult("zoomToPoint",
                  zoom.zoomToPoint(num(doc, "x", 0), num(doc, "y", 0), num(doc, "scale", 2.0)));
    }
    else if (cmd == "tick") {
      scheduler.advance(num(doc, "ms", 16));
    }
    else if (cmd == "resize") {
      double rect[4];
      if (readArray(doc, "container", rect, 4)) {
        geometry.setContainerRect(pz::Rect{rect[0], rect[1], rect[2], rect[3]});
      }
    }
    else if (cmd == "natural") {
      geometry.setNaturalSize(num(doc, "w", 0), num(doc, "h", 0));
    }
    else if (cmd == "redetect") {
      printResult("redetect", zoom.redetectMaxScale());
    }
    else if (cmd == "state") {
      std::printf("STATE %s\n", zoom.snapshotJson().c_str());
      std::fflush(stdout);
    }
    else if (cmd == "teardown") {
      zoom.teardown();
    }
    else {
      std::fprintf(stderr, "replay: unknown cmd '%s'\n", cmd.c_str());
    }
  }

  zoom.teardown();
  if (in != stdin) std::fclose(in);
  return 0;
}
