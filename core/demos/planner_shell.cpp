// Trip planner command shell
// Reads newline-delimited JSON commands from stdin, writes one JSON reply
// line per command to stdout.
// Usage: planner_shell [config.json]
//   reply: {"ok":true,"result":{...}}  or  {"ok":false,"error":{"code":..,"message":..,"details":{..}}}
// When the config names a snapshotPath, the store is loaded from it at start
// and written back at EOF.

#include "tp/session/PlannerConfig.hpp"
#include "tp/session/PlannerSession.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

static std::string readLine(bool& eof) {
  std::string line;
  int c;
  while ((c = std::fgetc(stdin)) != EOF && c != '\n') {
    line += static_cast<char>(c);
  }
  eof = (c == EOF);
  return line;
}

static bool readFile(const char* path, std::string& out) {
  std::ifstream f(path);
  if (!f) return false;
  std::stringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

static void writeReply(const tp::CmdResult& r) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("ok"); w.Bool(r.ok);
  if (r.ok) {
    w.Key("result");
    if (r.json.empty()) w.Null();
    else w.RawValue(r.json.c_str(), r.json.size(), rapidjson::kObjectType);
    if (r.createdId != 0) {
      w.Key("createdId"); w.Uint64(r.createdId);
    }
  } else {
    w.Key("error");
    w.StartObject();
    w.Key("code");    w.String(r.err.code.c_str());
    w.Key("message"); w.String(r.err.message.c_str());
    w.Key("details");
    const std::string details = r.err.details.empty() ? "{}" : r.err.details;
    w.RawValue(details.c_str(), details.size(), rapidjson::kObjectType);
    w.EndObject();
  }
  w.EndObject();

  std::fwrite(sb.GetString(), 1, sb.GetSize(), stdout);
  std::fputc('\n', stdout);
  std::fflush(stdout);
}

int main(int argc, char** argv) {
  tp::PlannerConfig config;
  if (argc > 1) {
    std::string text;
    if (!readFile(argv[1], text)) {
      std::fprintf(stderr, "planner_shell: cannot read config %s\n", argv[1]);
      return 1;
    }
    if (!tp::parsePlannerConfig(text, config)) {
      std::fprintf(stderr, "planner_shell: invalid config %s\n", argv[1]);
      return 1;
    }
  }

  tp::PlannerSession session(config);

  if (!config.snapshotPath.empty()) {
    std::ifstream existing(config.snapshotPath);
    if (existing && !session.loadSnapshot()) {
      std::fprintf(stderr, "planner_shell: failed to load snapshot %s\n",
                   config.snapshotPath.c_str());
      return 1;
    }
  }

  bool eof = false;
  while (!eof) {
    std::string line = readLine(eof);
    if (line.empty()) continue;

    tp::CmdResult r = session.applyJsonText(line);
    if (!r.ok) {
      std::fprintf(stderr, "planner_shell: %s: %s\n", r.err.code.c_str(), r.err.message.c_str());
    }
    writeReply(r);
  }

  if (!config.snapshotPath.empty() && !session.saveSnapshot()) {
    std::fprintf(stderr, "planner_shell: failed to save snapshot %s\n",
                 config.snapshotPath.c_str());
    return 1;
  }
  return 0;
}
