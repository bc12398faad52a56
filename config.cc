#include "ntfy.hh"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>

using namespace std;

static bool isValidKey(const string& key)
{
  if(key.empty() || isdigit((unsigned char)key[0]))
    return false;
  return key.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_") == string::npos;
}

static string formatLine(const string& key, const string& value, bool exported)
{
  return fmt::format("{}{}='{}'", exported ? "export " : "", key, value);
}

/* the file is meant to be sourceable by a shell too, so we parse it like one would:
   the first line that is not an assignment ends it, everything before that counts.
   All lines are kept so save() can write them back */
void ConfigFile::load()
{
  d_lines.clear();
  d_entries.clear();
  d_insertAt = 0;
  ifstream ifs(d_fname);
  if(!ifs)
    return;

  string raw;
  bool parsing = true;
  while(std::getline(ifs, raw)) {
    d_lines.push_back(raw);
    if(!parsing)
      continue;

    string line = trimSpace(raw);
    bool exported = false;
    if(startsWith(line, "export ")) {
      line = trimSpace(line.substr(7));
      exported = true;
    }
    if(!line.empty() && line[0] != '#') {
      auto pos = line.find('=');
      string key = pos == string::npos ? string() : line.substr(0, pos);
      if(!isValidKey(key)) {
        parsing = false;
        continue;
      }

      string value = trimSpace(line.substr(pos+1));
      if(!value.empty() && value[0] != '"' && value[0] != '\'') {
        pos = value.find(" #");
        if(pos != string::npos)
          value = trimSpace(value.substr(0, pos));
      }
      value = stripQuotes(value);

      auto iter = find_if(d_entries.begin(), d_entries.end(), [&](const Entry& e) { return e.key == key; });
      if(iter != d_entries.end()) {
        iter->value = value;
        iter->line = d_lines.size() - 1;
        iter->exported = exported;
      }
      else
        d_entries.push_back({key, value, d_lines.size() - 1, exported});
    }
    d_insertAt = d_lines.size();
  }
}

void ConfigFile::save() const
{
  filesystem::path p(d_fname);
  if(p.has_parent_path()) {
    std::error_code ec;
    filesystem::create_directories(p.parent_path(), ec);
    if(ec)
      throw std::runtime_error(fmt::format("Unable to create directory '{}': {}", p.parent_path().string(), ec.message()));
  }

  ofstream ofs(d_fname, std::ios::trunc);
  if(!ofs)
    throw std::runtime_error(fmt::format("Unable to open config file '{}' for writing: {}", d_fname, strerror(errno)));

  for(const auto& l : d_lines)
    ofs << l << "\n";
  ofs.flush();
  if(!ofs)
    throw std::runtime_error(fmt::format("Error writing config file '{}'", d_fname));
}

std::optional<string> ConfigFile::get(const string& key) const
{
  for(const auto& e : d_entries)
    if(e.key == key)
      return e.value;
  return std::optional<string>();
}

// values are written single quoted, so a shell takes them literally
void ConfigFile::set(const string& key, const string& value)
{
  if(!isValidKey(key))
    throw std::runtime_error(fmt::format("Invalid config key '{}'", key));
  for(char c : value) {
    if(iscntrl((unsigned char)c) || c == '\'')
      throw std::runtime_error(fmt::format("Value for {} may not contain quotes or control characters", key));
  }

  for(auto& e : d_entries) {
    if(e.key == key) {
      e.value = value;
      d_lines[e.line] = formatLine(key, value, e.exported);
      return;
    }
  }
  d_lines.insert(d_lines.begin() + d_insertAt, formatLine(key, value, false));
  d_entries.push_back({key, value, d_insertAt, false});
  d_insertAt++;
}

static std::optional<string> getNonEmpty(const Environment& env, const string& name)
{
  if(auto iter = env.find(name); iter != env.end() && !iter->second.empty())
    return iter->second;
  return std::optional<string>();
}

string getConfigPath(const Environment& env)
{
  if(auto p = getNonEmpty(env, "NTFY_CONFIG"))
    return *p;
  if(auto p = getNonEmpty(env, "XDG_CONFIG_HOME"))
    return *p + "/ntfy-cli/ntfy.conf";
  if(auto p = getNonEmpty(env, "HOME"))
    return *p + "/.config/ntfy-cli/ntfy.conf";
  return "ntfy.conf";
}

// flag > environment > config file > default
EffectiveConfig resolveConfig(const Environment& env, const ConfigFile& cf, const CmdLine& cl)
{
  EffectiveConfig ec;

  auto pick = [&](string& dest, const char* key, const std::optional<string>& flag, bool useEnv) {
    if(flag) {
      dest = *flag;
      return;
    }
    if(useEnv) {
      if(auto e = getNonEmpty(env, key)) {
        dest = *e;
        return;
      }
    }
    if(auto c = cf.get(key); c && !c->empty())
      dest = *c;
  };

  // -u is a full override URL, not a base, so it does not take part here
  pick(ec.baseURL, "NTFY_BASE_URL", std::optional<string>(), true);
  pick(ec.topic, "NTFY_TOPIC", cl.topic, true);
  pick(ec.method, "NTFY_METHOD", cl.method, false);
  return ec;
}
