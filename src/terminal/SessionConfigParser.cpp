#include "SessionConfigParser.hpp"

#include "LaunchTransforms.hpp"

namespace pt {
namespace {
const string SESSION_SECTION_PREFIX = "session:";
}

PermTermConfig SessionConfigParser::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  LOG(INFO) << "Loaded config file " << path;
  return parseIni(ini);
}

PermTermConfig SessionConfigParser::loadString(const string& contents) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(contents);
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  return parseIni(ini);
}

SessionConfig SessionConfigParser::parseSessionFlag(const string& flag) {
  auto pos = flag.find('=');
  if (pos == string::npos || pos == 0) {
    throw std::runtime_error("Expected name=command, got: " + flag);
  }
  string name = trim(flag.substr(0, pos));
  string command = trim(flag.substr(pos + 1));
  if (name.empty()) {
    throw std::runtime_error("Expected name=command, got: " + flag);
  }
  return buildSession(name, command, "", false, "", "");
}

char SessionConfigParser::parsePrefixKey(const string& key) {
  string k = trim(key);
  string lowered = k;
  transform(lowered.begin(), lowered.end(), lowered.begin(),
            [](unsigned char c) { return char(::tolower(c)); });
  string chord;
  if (lowered.rfind("ctrl-", 0) == 0) {
    chord = k.substr(5);
  } else if (lowered.rfind("c-", 0) == 0) {
    chord = k.substr(2);
  } else if (k.length() == 2 && k[0] == '^') {
    chord = k.substr(1);
  } else if (k.length() == 1) {
    return k[0];
  } else {
    throw std::runtime_error("Invalid prefix key: " + key);
  }
  if (chord.length() != 1) {
    throw std::runtime_error("Invalid prefix key: " + key);
  }
  char c = char(::toupper((unsigned char)chord[0]));
  if (c < '@' || c > '_') {
    throw std::runtime_error("Invalid prefix key: " + key);
  }
  return char(c - '@');
}

string SessionConfigParser::defaultViewTag(const string& name) {
  return "permterm://" + name;
}

PermTermConfig SessionConfigParser::parseIni(CSimpleIniA& ini) {
  PermTermConfig config;

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config.verbose = atoi(vlevel);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent && atoi(silent) != 0) {
    config.silent = true;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxlogsize is a string of int value
    config.maxlogsize = to_string(atoi(logsize));
  }
  const char* prefix = ini.GetValue("Console", "prefix", NULL);
  if (prefix) {
    config.prefixKey = parsePrefixKey(prefix);
  }

  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  sections.sort(CSimpleIniA::Entry::LoadOrder());
  for (const auto& section : sections) {
    string sectionName(section.pItem);
    if (sectionName.rfind(SESSION_SECTION_PREFIX, 0) != 0) {
      continue;
    }
    string name = trim(sectionName.substr(SESSION_SECTION_PREFIX.length()));
    if (name.empty()) {
      throw std::runtime_error("Session section without a name: " +
                               sectionName);
    }
    const char* cmd = ini.GetValue(section.pItem, "cmd", "");
    const char* tag = ini.GetValue(section.pItem, "tag", "");
    bool expandEnv = ini.GetBoolValue(section.pItem, "expand_env", false);
    const char* outputFile = ini.GetValue(section.pItem, "output_file", "");
    const char* outputCommand =
        ini.GetValue(section.pItem, "output_command", "");
    config.sessions.push_back(buildSession(name, cmd, tag, expandEnv,
                                           outputFile, outputCommand));
  }
  return config;
}

SessionConfig SessionConfigParser::buildSession(const string& name,
                                                const string& command,
                                                const string& tag,
                                                bool expandEnv,
                                                const string& outputFile,
                                                const string& outputCommand) {
  SessionConfig session;
  session.name = name;
  session.launchSpec = command;
  session.viewTag = tag.empty() ? defaultViewTag(name) : tag;
  if (expandEnv) {
    session.onBeforeLaunch = LaunchTransforms::environmentExpander();
  }
  vector<ExitCallback> sinks;
  if (!outputFile.empty()) {
    sinks.push_back(LaunchTransforms::writeLinesToFile(
        LaunchTransforms::expandEnvironment(outputFile)));
  }
  if (!outputCommand.empty()) {
    sinks.push_back(
        LaunchTransforms::pipeLinesToCommand(subprocessUtils, outputCommand));
  }
  if (sinks.size() == 1) {
    session.onExit = sinks.front();
  } else if (sinks.size() > 1) {
    session.onExit = LaunchTransforms::chain(sinks);
  }
  VLOG(1) << "Configured session " << name << ": " << command;
  return session;
}
}  // namespace pt
