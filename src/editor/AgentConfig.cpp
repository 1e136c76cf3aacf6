#include "AgentConfig.hpp"

#include "DiffEngine.hpp"
#include "SimpleIni.h"

namespace sshed {
AgentConfig::AgentConfig()
    : maxConnections(8),
      contextLines(DiffEngine::DEFAULT_CONTEXT_LINES),
      verbose(0),
      logSize("20971520"),
      logDirectory(GetTempDirectory() + "sshed") {}

int AgentConfig::parseCount(const string& key, const string& value) {
  string text = trim(value);
  if (text.empty() || text.length() > 9 ||
      !all_of(text.begin(), text.end(),
              [](char c) { return c >= '0' && c <= '9'; })) {
    throw runtime_error("Invalid value for " + key + ": " + value);
  }
  return stoi(text);
}

void AgentConfig::loadFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw runtime_error("Invalid config file: " + filename);
  }

  const char* socketString = ini.GetValue("Agent", "socket", NULL);
  if (socketString) {
    socketAddress = string(socketString);
  }
  const char* maxConnectionsString =
      ini.GetValue("Agent", "max_connections", NULL);
  if (maxConnectionsString) {
    maxConnections = parseCount("max_connections", maxConnectionsString);
    if (maxConnections < 1) {
      throw runtime_error("max_connections must be at least 1");
    }
  }
  const char* editorString = ini.GetValue("Agent", "editor", NULL);
  if (editorString) {
    editor = string(editorString);
  }
  const char* contextString = ini.GetValue("Agent", "context_lines", NULL);
  if (contextString) {
    contextLines = parseCount("context_lines", contextString);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = parseCount("verbose", vlevel);
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize) {
    // Validated here, handed to easylogging++ as a string
    if (parseCount("logsize", logsize) == 0) {
      throw runtime_error("logsize must be positive");
    }
    logSize = trim(logsize);
  }
  const char* logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir && logdir[0] != '\0') {
    logDirectory = string(logdir);
  }
  VLOG(1) << "Loaded config file " << filename;
}
}  // namespace sshed
