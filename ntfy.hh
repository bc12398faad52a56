#pragma once
#include <cstdio>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include "support.hh"

#ifndef NTFYCLI_VERSION
#define NTFYCLI_VERSION "unknown"
#endif

// bad flag, missing value, invalid method, no message. Exit code 1, with usage.
class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// the request went out (or tried to) and did not get a 2xx/3xx
class DeliveryError : public std::runtime_error
{
public:
  DeliveryError(const std::string& what, int exitCode) : std::runtime_error(what), d_exitCode(exitCode)
  {}
  int getExitCode() const { return d_exitCode; }
private:
  int d_exitCode;
};

// only the variables we care about, so tests can pass their own
typedef std::map<std::string, std::string> Environment;

// ordered, setting an existing name replaces it in place
typedef std::vector<std::pair<std::string, std::string>> HeaderSet;
void setHeader(HeaderSet& hs, const std::string& name, const std::string& value);

// returns nullopt if stdin is a terminal. Called at most once per invocation.
typedef std::function<std::optional<std::string>()> StdinReader;

struct EffectiveConfig
{
  std::string baseURL = "https://ntfy.sh";
  std::string topic = "general";
  std::string method = "POST";
};

/* Persisted defaults, a flat file of KEY=VALUE lines like:

   NTFY_BASE_URL="https://ntfy.example.com"
   NTFY_TOPIC=alerts
   NTFY_METHOD=POST

   save() writes back every line it read, only assignments touched by set() change. */
class ConfigFile
{
public:
  explicit ConfigFile(const std::string& fname) : d_fname(fname) {}
  void load();
  void save() const;
  std::optional<std::string> get(const std::string& key) const;
  void set(const std::string& key, const std::string& value);
  const std::string& getFilename() const { return d_fname; }
  size_t size() const { return d_entries.size(); }
private:
  struct Entry
  {
    std::string key, value;
    size_t line;
    bool exported;
  };
  std::string d_fname;
  std::vector<std::string> d_lines;
  std::vector<Entry> d_entries;
  size_t d_insertAt = 0;  // new assignments go here, before any line that stopped parsing
};

std::string getConfigPath(const Environment& env);

enum class Action { Send, Help, Version, ShowURL, ShowTopic, ShowMethod, ShowConfig, SetURL, SetTopic, SetMethod };

struct CmdLine
{
  Action action = Action::Send;
  std::string actionArg;  // the value for the --set-X actions
  std::optional<std::string> url, topic, method;
  HeaderSet headers;
  std::vector<std::string> words;
  bool quiet = false;
  bool verbose = false;
};

CmdLine parseCmdLine(const std::vector<std::string>& args);
EffectiveConfig resolveConfig(const Environment& env, const ConfigFile& cf, const CmdLine& cl);
std::string getUsage(const EffectiveConfig& ec);

class Sender;

bool urlHasPath(const std::string& url);
std::string buildTargetURL(const EffectiveConfig& ec, const std::optional<std::string>& overrideURL);
void checkMethod(const std::string& method);
std::string pickMessage(const StdinReader& readStdin, const std::vector<std::string>& words);

// everything main() does, minus the process. Returns the exit code.
int runNtfy(const std::vector<std::string>& args, const Environment& env,
            const StdinReader& readStdin, Sender& sender,
            FILE* out, FILE* err);
