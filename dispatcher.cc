#include "ntfy.hh"
#include "sender.hh"
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

using namespace std;

// anything after scheme://host[:port] except a lone / counts as a path
bool urlHasPath(const string& url)
{
  auto pos = url.find("://");
  pos = (pos == string::npos) ? 0 : pos + 3;
  pos = url.find_first_of("/?#", pos);
  if(pos == string::npos)
    return false;
  string rest = url.substr(pos);
  return !(rest.empty() || rest == "/");
}

static string joinURL(const string& base, const string& topic)
{
  string b = base;
  while(!b.empty() && b.back() == '/')
    b.pop_back();
  auto pos = topic.find_first_not_of('/');
  return b + "/" + (pos == string::npos ? string() : topic.substr(pos));
}

string buildTargetURL(const EffectiveConfig& ec, const std::optional<string>& overrideURL)
{
  if(overrideURL) {
    if(urlHasPath(*overrideURL))
      return *overrideURL;
    return joinURL(*overrideURL, ec.topic);
  }
  return joinURL(ec.baseURL, ec.topic);
}

void checkMethod(const string& method)
{
  if(method != "GET" && method != "POST")
    throw UsageError(fmt::format("Method must be GET or POST (got \"{}\")", method));
}

// stdin wins if anything was piped in, otherwise the words make up the message
string pickMessage(const StdinReader& readStdin, const vector<string>& words)
{
  if(auto in = readStdin(); in && !in->empty())
    return *in;
  string msg = joinWords(words);
  if(msg.empty())
    throw UsageError("No message. Pipe one into this command or pass it as arguments.");
  return msg;
}

// ntfy answers a publish with {"id":"...","time":...,"event":"message",...}
static std::optional<string> getMessageId(const string& body)
{
  auto j = nlohmann::json::parse(body, nullptr, false);
  if(j.is_discarded() || !j.is_object())
    return std::optional<string>();
  if(auto iter = j.find("id"); iter != j.end() && iter->is_string())
    return iter->get<string>();
  return std::optional<string>();
}

static int sendMessage(const EffectiveConfig& ec, const CmdLine& cl, const StdinReader& readStdin,
                       Sender& sender, FILE* err)
{
  checkMethod(ec.method);
  string target = buildTargetURL(ec, cl.url);
  string body = pickMessage(readStdin, cl.words);

  if(cl.verbose) {
    vector<string> names;
    for(const auto& h : cl.headers)
      names.push_back(h.first);
    fmt::print(err, "ntfy: {} {}, {} bytes, headers {}\n", ec.method, target, body.size(), names);
  }

  DTime dt;
  HTTPResult res = sender.send(ec.method, target, cl.headers, body);
  if(cl.verbose)
    fmt::print(err, "ntfy: {} answered HTTP {} after {} msec\n", sender.getSenderName(), res.status, dt.lapMsec());

  if(res.status < 200 || res.status >= 400)
    throw DeliveryError(fmt::format("Unexpected HTTP status {} from {}", res.status, target), 2);

  if(!cl.quiet) {
    if(auto id = getMessageId(res.body))
      fmt::print(err, "ntfy: message sent successfully (HTTP {}, id {})\n", res.status, *id);
    else
      fmt::print(err, "ntfy: message sent successfully (HTTP {})\n", res.status);
  }
  return 0;
}

static void storeDefault(ConfigFile& cf, const string& key, const string& value, const char* what, FILE* err)
{
  cf.set(key, value);
  cf.save();
  fmt::print(err, "ntfy: default {} set to {} in {}\n", what, value, cf.getFilename());
}

int runNtfy(const vector<string>& args, const Environment& env,
            const StdinReader& readStdin, Sender& sender,
            FILE* out, FILE* err)
{
  ConfigFile cf(getConfigPath(env));
  EffectiveConfig ec;
  try {
    cf.load();
    ec = resolveConfig(env, cf, CmdLine());
    CmdLine cl = parseCmdLine(args);
    ec = resolveConfig(env, cf, cl);

    switch(cl.action) {
    case Action::Help:
      fmt::print(err, "{}", getUsage(ec));
      return 0;
    case Action::Version:
      fmt::print(out, "ntfy-cli {}\n", NTFYCLI_VERSION);
      return 0;
    case Action::ShowURL:
      fmt::print(out, "{}\n", cl.url ? *cl.url : ec.baseURL);
      return 0;
    case Action::ShowTopic:
      fmt::print(out, "{}\n", ec.topic);
      return 0;
    case Action::ShowMethod:
      fmt::print(out, "{}\n", ec.method);
      return 0;
    case Action::ShowConfig: {
      std::error_code fsec;
      bool present = filesystem::exists(cf.getFilename(), fsec);
      fmt::print(out, "base-url: {}\ntopic: {}\nmethod: {}\ntarget: {}\nconfig-file: {}{}\n",
                 ec.baseURL, ec.topic, ec.method, buildTargetURL(ec, cl.url), cf.getFilename(),
                 present ? "" : " (not present)");
      return 0;
    }
    case Action::SetURL:
      storeDefault(cf, "NTFY_BASE_URL", cl.actionArg, "base URL", err);
      return 0;
    case Action::SetTopic:
      storeDefault(cf, "NTFY_TOPIC", cl.actionArg, "topic", err);
      return 0;
    case Action::SetMethod:
      checkMethod(cl.actionArg);
      storeDefault(cf, "NTFY_METHOD", cl.actionArg, "method", err);
      return 0;
    case Action::Send:
      break;
    }
    return sendMessage(ec, cl, readStdin, sender, err);
  }
  catch(UsageError& e) {
    fmt::print(err, "ntfy: {}\n\n{}", e.what(), getUsage(ec));
    return 1;
  }
  catch(DeliveryError& e) {
    fmt::print(err, "ntfy: {}\n", e.what());
    return e.getExitCode();
  }
  catch(std::exception& e) {
    fmt::print(err, "ntfy: {}\n", e.what());
    return 1;
  }
}
