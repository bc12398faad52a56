#include "ntfy.hh"
#include <fmt/format.h>

using namespace std;

void setHeader(HeaderSet& hs, const string& name, const string& value)
{
  for(auto& h : hs) {
    if(h.first == name) {
      h.second = value;
      return;
    }
  }
  hs.emplace_back(name, value);
}

namespace {
struct HeaderFlag
{
  const char* header;
  const char* fixed = nullptr;  // set for flags that take no value
  const char* prefix = "";
};
}

// every flag that just ends up as a request header
static const std::map<std::string, HeaderFlag> s_headerFlags = {
  {"--title",             {"Title"}},
  {"--priority",          {"Priority"}},
  {"--tags",              {"Tags"}},
  {"--delay",             {"Delay"}},
  {"--actions",           {"Actions"}},
  {"--click",             {"Click"}},
  {"--attach",            {"Attach"}},
  {"--markdown",          {"Markdown", "yes"}},
  {"--icon",              {"Icon"}},
  {"--filename",          {"Filename"}},
  {"--email",             {"Email"}},
  {"--call",              {"Call"}},
  {"--cache",             {"Cache"}},
  {"--firebase",          {"Firebase"}},
  {"--unified-push",      {"UnifiedPush", "1"}},
  {"--poll-id",           {"Poll-ID"}},
  {"--auth-bearer-token", {"Authorization", nullptr, "Bearer "}},
  {"--content-type",      {"Content-Type"}}
};

/* Walks the arguments once, left to right. The first help, version, show or set
   flag ends the walk, whatever follows it is not looked at. */
CmdLine parseCmdLine(const vector<string>& args)
{
  CmdLine cl;
  bool onlyWords = false;

  for(size_t n = 0; n < args.size(); ++n) {
    const string& arg = args[n];
    if(onlyWords || arg.size() < 2 || arg[0] != '-') {
      cl.words.push_back(arg);
      continue;
    }
    if(arg == "--") {
      onlyWords = true;
      continue;
    }

    string name = arg;
    std::optional<string> inlineValue;
    if(startsWith(arg, "--")) {
      if(auto pos = arg.find('='); pos != string::npos) {
        name = arg.substr(0, pos);
        inlineValue = arg.substr(pos + 1);
      }
    }

    // -t alerts sets the topic, -t on its own (or followed by another flag) shows it
    auto optionalValue = [&]() -> std::optional<string> {
      if(inlineValue) {
        if(inlineValue->empty())
          return std::optional<string>();
        return inlineValue;
      }
      if(n + 1 < args.size() && !startsWith(args[n+1], "-"))
        return args[++n];
      return std::optional<string>();
    };
    auto requiredValue = [&]() -> string {
      if(inlineValue) {
        if(inlineValue->empty())
          throw UsageError(fmt::format("Empty argument for {}", name));
        return *inlineValue;
      }
      if(n + 1 >= args.size())
        throw UsageError(fmt::format("Missing argument for {}", name));
      return args[++n];
    };
    auto noValue = [&]() {
      if(inlineValue)
        throw UsageError(fmt::format("Option {} does not take an argument", name));
    };

    if(name == "-h" || name == "--help") {
      noValue();
      cl.action = Action::Help;
      return cl;
    }
    else if(name == "-V" || name == "--version") {
      noValue();
      cl.action = Action::Version;
      return cl;
    }
    else if(name == "-u" || name == "--url") {
      auto v = optionalValue();
      if(!v) {
        cl.action = Action::ShowURL;
        return cl;
      }
      cl.url = v;
    }
    else if(name == "-t" || name == "--topic") {
      auto v = optionalValue();
      if(!v) {
        cl.action = Action::ShowTopic;
        return cl;
      }
      cl.topic = v;
    }
    else if(name == "-m" || name == "--method") {
      auto v = optionalValue();
      if(!v) {
        cl.action = Action::ShowMethod;
        return cl;
      }
      cl.method = v;
    }
    else if(name == "--show-config") {
      noValue();
      cl.action = Action::ShowConfig;
      return cl;
    }
    else if(name == "--set-url" || name == "--set-topic" || name == "--set-method") {
      cl.actionArg = requiredValue();
      if(name == "--set-url")
        cl.action = Action::SetURL;
      else if(name == "--set-topic")
        cl.action = Action::SetTopic;
      else
        cl.action = Action::SetMethod;
      return cl;
    }
    else if(name == "-q" || name == "--quiet") {
      noValue();
      cl.quiet = true;
    }
    else if(name == "-v" || name == "--verbose") {
      noValue();
      cl.verbose = true;
    }
    else if(auto iter = s_headerFlags.find(name); iter != s_headerFlags.end()) {
      const HeaderFlag& hf = iter->second;
      if(hf.fixed) {
        noValue();
        setHeader(cl.headers, hf.header, hf.fixed);
      }
      else
        setHeader(cl.headers, hf.header, hf.prefix + requiredValue());
    }
    else
      throw UsageError(fmt::format("Unknown option: {}", arg));
  }
  return cl;
}

string getUsage(const EffectiveConfig& ec)
{
  return fmt::format(R"(Usage: ntfy [options] [message ...]
       command | ntfy [options]

The message is read from stdin when something is piped in, otherwise the
remaining arguments are joined with spaces.

Target:
  -u, --url [URL]        Send to this URL once. Without a path, /TOPIC is appended.
                         Without an argument, print the base URL ({})
  -t, --topic [NAME]     Topic for this message. Without an argument, print it ({})
  -m, --method [M]       GET or POST. Without an argument, print it ({})
      --set-url URL      Store the default base URL and exit
      --set-topic NAME   Store the default topic and exit
      --set-method M     Store the default method and exit
      --show-config      Print the effective settings and the config file

Message headers:
      --title TEXT  --priority P  --tags A,B  --delay WHEN  --actions SPEC
      --click URL   --attach URL  --markdown  --icon URL    --filename NAME
      --email ADDR  --call NUMBER --cache no  --firebase no --unified-push
      --poll-id ID  --auth-bearer-token TOKEN  --content-type TYPE

Other:
  -q, --quiet            Do not report success
  -v, --verbose          Trace the request on stderr
  -h, --help             Show this help and exit
  -V, --version          Show the version and exit

Environment:
  NTFY_BASE_URL   Base URL (default: https://ntfy.sh)
  NTFY_TOPIC      Default topic (default: general)
  NTFY_CONFIG     Config file (default: $XDG_CONFIG_HOME/ntfy-cli/ntfy.conf)

Exit status:
  0   Success (2xx/3xx)
  1   Invalid usage (no message, bad options)
  2   Unexpected HTTP status
  >2  curl error
)", ec.baseURL, ec.topic, ec.method);
}
