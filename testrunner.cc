#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <unistd.h>
#include <doctest/doctest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "ntfy.hh"
#include "sender.hh"

using namespace std;

namespace {
// collects what runNtfy prints
struct Capture
{
  Capture() : f(tmpfile())
  {
    if(!f)
      throw std::runtime_error("tmpfile() failed");
  }
  ~Capture()
  {
    fclose(f);
  }
  string str()
  {
    fflush(f);
    rewind(f);
    string ret;
    char buf[4096];
    size_t n;
    while((n = fread(buf, 1, sizeof(buf), f)) > 0)
      ret.append(buf, n);
    return ret;
  }
  FILE* f;
};

struct TmpDir
{
  TmpDir()
  {
    static std::atomic<int> counter{0};
    path = filesystem::temp_directory_path() / fmt::format("ntfy-test-{}-{}", getpid(), counter++);
    filesystem::create_directories(path);
  }
  ~TmpDir()
  {
    std::error_code ec;
    filesystem::remove_all(path, ec);
  }
  string file(const string& name) const { return (path / name).string(); }
  filesystem::path path;
};

struct RecordingSender : public Sender
{
  RecordingSender()
  {
    d_senderName = "recorder";
  }
  struct Request
  {
    string method, url, body;
    HeaderSet headers;
  };
  HTTPResult send(const string& method, const string& url,
                  const HeaderSet& headers, const string& body) override
  {
    requests.push_back({method, url, body, headers});
    return result;
  }
  vector<Request> requests;
  HTTPResult result{200, R"({"id":"hGbyuZZUkTvZ","time":1700000000,"event":"message","topic":"general"})"};
};

StdinReader noStdin()
{
  return []() { return std::optional<string>(); };
}

StdinReader withStdin(const string& data)
{
  return [data]() { return std::optional<string>(data); };
}

void writeFile(const string& fname, const string& content)
{
  ofstream ofs(fname);
  ofs << content;
}
}

TEST_CASE("target URL") {
  EffectiveConfig ec;

  SUBCASE("defaults") {
    CHECK(buildTargetURL(ec, std::nullopt) == "https://ntfy.sh/general");
  }

  SUBCASE("trailing slash on the base is normalized") {
    ec.baseURL = "https://ntfy.example.com/";
    ec.topic = "alerts";
    CHECK(buildTargetURL(ec, std::nullopt) == "https://ntfy.example.com/alerts");
    ec.baseURL = "https://ntfy.example.com//";
    ec.topic = "/alerts";
    CHECK(buildTargetURL(ec, std::nullopt) == "https://ntfy.example.com/alerts");
  }

  SUBCASE("override without a path gets the topic") {
    ec.topic = "backups";
    CHECK(buildTargetURL(ec, string("https://push.example.org")) == "https://push.example.org/backups");
    CHECK(buildTargetURL(ec, string("https://push.example.org/")) == "https://push.example.org/backups");
    CHECK(buildTargetURL(ec, string("http://10.0.0.1:8080")) == "http://10.0.0.1:8080/backups");
  }

  SUBCASE("override with a path is used verbatim") {
    ec.topic = "backups";
    CHECK(buildTargetURL(ec, string("https://push.example.org/life")) == "https://push.example.org/life");
    CHECK(buildTargetURL(ec, string("https://example.com/api/v1/hook?x=1")) == "https://example.com/api/v1/hook?x=1");
  }

  SUBCASE("path detection") {
    CHECK(!urlHasPath("https://ntfy.sh"));
    CHECK(!urlHasPath("https://ntfy.sh/"));
    CHECK(!urlHasPath("ntfy.sh"));
    CHECK(urlHasPath("https://ntfy.sh/topic"));
    CHECK(urlHasPath("ntfy.sh/topic"));
  }
}

TEST_CASE("method check") {
  CHECK_NOTHROW(checkMethod("GET"));
  CHECK_NOTHROW(checkMethod("POST"));
  CHECK_THROWS_AS(checkMethod("PUT"), UsageError);
  CHECK_THROWS_AS(checkMethod("post"), UsageError);
  CHECK_THROWS_AS(checkMethod(""), UsageError);
}

TEST_CASE("message source") {
  SUBCASE("stdin wins over arguments") {
    CHECK(pickMessage(withStdin("from a pipe\n"), {"from", "args"}) == "from a pipe\n");
  }
  SUBCASE("arguments are joined with spaces") {
    CHECK(pickMessage(noStdin(), {"disk", "is", "full"}) == "disk is full");
  }
  SUBCASE("empty stdin falls back to arguments") {
    CHECK(pickMessage(withStdin(""), {"hello"}) == "hello");
  }
  SUBCASE("nothing at all") {
    CHECK_THROWS_AS(pickMessage(noStdin(), {}), UsageError);
    CHECK_THROWS_AS(pickMessage(withStdin(""), {}), UsageError);
  }
  SUBCASE("stdin is read once") {
    int calls = 0;
    StdinReader reader = [&calls]() { ++calls; return std::optional<string>("x"); };
    pickMessage(reader, {"y"});
    CHECK(calls == 1);
  }
}

TEST_CASE("config file") {
  TmpDir td;
  string fname = td.file("ntfy.conf");

  SUBCASE("missing file is empty") {
    ConfigFile cf(fname);
    CHECK_NOTHROW(cf.load());
    CHECK(cf.size() == 0);
    CHECK(!cf.get("NTFY_TOPIC"));
  }

  SUBCASE("assignments, quotes and comments") {
    writeFile(fname, R"(# defaults for ntfy
NTFY_BASE_URL="https://ntfy.example.com/"

export NTFY_TOPIC='alerts'
OTHER=keep me   # trailing comment
)");
    ConfigFile cf(fname);
    cf.load();
    CHECK(cf.size() == 3);
    CHECK(*cf.get("NTFY_BASE_URL") == "https://ntfy.example.com/");
    CHECK(*cf.get("NTFY_TOPIC") == "alerts");
    CHECK(*cf.get("OTHER") == "keep me");
  }

  SUBCASE("first malformed line ends parsing") {
    writeFile(fname, "NTFY_TOPIC=first\nthis is not an assignment\nNTFY_METHOD=GET\n");
    ConfigFile cf(fname);
    cf.load();
    CHECK(*cf.get("NTFY_TOPIC") == "first");
    CHECK(!cf.get("NTFY_METHOD"));

    writeFile(fname, "NTFY_TOPIC=first\n1BAD=x\nNTFY_METHOD=GET\n");
    cf.load();
    CHECK(cf.size() == 1);
  }

  SUBCASE("save keeps unknown keys and order") {
    writeFile(fname, "OTHER=something\nNTFY_TOPIC=old\n");
    ConfigFile cf(fname);
    cf.load();
    cf.set("NTFY_TOPIC", "new");
    cf.set("NTFY_METHOD", "GET");
    cf.save();

    ConfigFile again(fname);
    again.load();
    CHECK(again.size() == 3);
    CHECK(*again.get("OTHER") == "something");
    CHECK(*again.get("NTFY_TOPIC") == "new");
    CHECK(*again.get("NTFY_METHOD") == "GET");
  }

  SUBCASE("save keeps comments and lines after a malformed one") {
    writeFile(fname, "# my notes\nNTFY_TOPIC=a\nsome garbage line\nNTFY_BASE_URL=https://mine.example\n");
    ConfigFile cf(fname);
    cf.load();
    cf.set("NTFY_METHOD", "GET");
    cf.set("NTFY_TOPIC", "b");
    cf.save();

    ifstream ifs(fname);
    string content{istreambuf_iterator<char>(ifs), istreambuf_iterator<char>()};
    CHECK(content == "# my notes\nNTFY_TOPIC='b'\nNTFY_METHOD='GET'\nsome garbage line\nNTFY_BASE_URL=https://mine.example\n");

    ConfigFile again(fname);
    again.load();
    CHECK(*again.get("NTFY_METHOD") == "GET");
    CHECK(*again.get("NTFY_TOPIC") == "b");
  }

  SUBCASE("values a shell would not take literally are refused") {
    ConfigFile cf(fname);
    CHECK_THROWS(cf.set("NTFY_TOPIC", "two\nlines"));
    CHECK_THROWS(cf.set("NTFY_TOPIC", "it's"));
    CHECK_THROWS(cf.set("NOT A KEY", "x"));
    CHECK_NOTHROW(cf.set("NTFY_TOPIC", "costs_$5"));
    CHECK(cf.size() == 1);
  }

  SUBCASE("save creates the directory") {
    ConfigFile cf(td.file("deeper/still/ntfy.conf"));
    cf.set("NTFY_TOPIC", "x");
    CHECK_NOTHROW(cf.save());
    CHECK(filesystem::exists(td.file("deeper/still/ntfy.conf")));
  }
}

TEST_CASE("config path") {
  CHECK(getConfigPath({{"NTFY_CONFIG", "/etc/ntfy.conf"}, {"HOME", "/home/ahu"}}) == "/etc/ntfy.conf");
  CHECK(getConfigPath({{"XDG_CONFIG_HOME", "/xdg"}, {"HOME", "/home/ahu"}}) == "/xdg/ntfy-cli/ntfy.conf");
  CHECK(getConfigPath({{"XDG_CONFIG_HOME", ""}, {"HOME", "/home/ahu"}}) == "/home/ahu/.config/ntfy-cli/ntfy.conf");
}

TEST_CASE("precedence") {
  TmpDir td;
  string fname = td.file("ntfy.conf");
  writeFile(fname, "NTFY_BASE_URL=https://file.example\nNTFY_TOPIC=fromfile\nNTFY_METHOD=GET\n");
  ConfigFile cf(fname);
  CmdLine cl;

  SUBCASE("defaults") {
    ConfigFile empty(td.file("absent.conf"));
    empty.load();
    auto ec = resolveConfig({}, empty, cl);
    CHECK(ec.baseURL == "https://ntfy.sh");
    CHECK(ec.topic == "general");
    CHECK(ec.method == "POST");
  }
  SUBCASE("file beats defaults") {
    cf.load();
    auto ec = resolveConfig({}, cf, cl);
    CHECK(ec.baseURL == "https://file.example");
    CHECK(ec.topic == "fromfile");
    CHECK(ec.method == "GET");
  }
  SUBCASE("environment beats file") {
    cf.load();
    auto ec = resolveConfig({{"NTFY_BASE_URL", "https://env.example"}, {"NTFY_TOPIC", "fromenv"}}, cf, cl);
    CHECK(ec.baseURL == "https://env.example");
    CHECK(ec.topic == "fromenv");
  }
  SUBCASE("flags beat environment") {
    cf.load();
    cl.topic = "fromflag";
    cl.method = "POST";
    auto ec = resolveConfig({{"NTFY_TOPIC", "fromenv"}}, cf, cl);
    CHECK(ec.topic == "fromflag");
    CHECK(ec.method == "POST");
  }
}

TEST_CASE("command line") {
  SUBCASE("one-shot values and words") {
    auto cl = parseCmdLine({"-t", "alerts", "--method=GET", "disk", "full"});
    CHECK(cl.action == Action::Send);
    CHECK(*cl.topic == "alerts");
    CHECK(*cl.method == "GET");
    CHECK(cl.words == vector<string>{"disk", "full"});
  }

  SUBCASE("flags without a value show") {
    CHECK(parseCmdLine({"-t"}).action == Action::ShowTopic);
    CHECK(parseCmdLine({"--url"}).action == Action::ShowURL);
    CHECK(parseCmdLine({"-m", "-q"}).action == Action::ShowMethod);
    CHECK(parseCmdLine({"--topic="}).action == Action::ShowTopic);
  }

  SUBCASE("a show flag keeps the value given earlier") {
    auto cl = parseCmdLine({"-u", "https://push.example.org/x", "-u"});
    CHECK(cl.action == Action::ShowURL);
    REQUIRE(cl.url);
    CHECK(*cl.url == "https://push.example.org/x");

    cl = parseCmdLine({"-t", "x", "-t"});
    CHECK(cl.action == Action::ShowTopic);
    REQUIRE(cl.topic);
    CHECK(*cl.topic == "x");
  }

  SUBCASE("terminal actions stop the walk") {
    auto cl = parseCmdLine({"--set-topic", "ops", "--no-such-flag"});
    CHECK(cl.action == Action::SetTopic);
    CHECK(cl.actionArg == "ops");
    CHECK(parseCmdLine({"--help", "--bogus"}).action == Action::Help);
    CHECK(parseCmdLine({"--version"}).action == Action::Version);
  }

  SUBCASE("usage errors") {
    CHECK_THROWS_AS(parseCmdLine({"--no-such-flag"}), UsageError);
    CHECK_THROWS_AS(parseCmdLine({"--set-url"}), UsageError);
    CHECK_THROWS_AS(parseCmdLine({"--set-topic="}), UsageError);
    CHECK_THROWS_AS(parseCmdLine({"hello", "--title"}), UsageError);
    CHECK_THROWS_AS(parseCmdLine({"--markdown=yes"}), UsageError);
  }

  SUBCASE("header flags") {
    auto cl = parseCmdLine({"--title", "Backup", "--priority=5", "--tags", "warning,skull",
                            "--markdown", "--auth-bearer-token", "tk_secret", "--title", "Backup done",
                            "--unified-push", "msg"});
    HeaderSet expected = {
      {"Title", "Backup done"},
      {"Priority", "5"},
      {"Tags", "warning,skull"},
      {"Markdown", "yes"},
      {"Authorization", "Bearer tk_secret"},
      {"UnifiedPush", "1"}
    };
    CHECK(cl.headers == expected);
    CHECK(cl.words == vector<string>{"msg"});
  }

  SUBCASE("every header flag maps") {
    vector<pair<string, string>> flags = {
      {"--delay", "Delay"}, {"--actions", "Actions"}, {"--click", "Click"}, {"--attach", "Attach"},
      {"--icon", "Icon"}, {"--filename", "Filename"}, {"--email", "Email"}, {"--call", "Call"},
      {"--cache", "Cache"}, {"--firebase", "Firebase"}, {"--poll-id", "Poll-ID"},
      {"--content-type", "Content-Type"}
    };
    for(const auto& f : flags) {
      auto cl = parseCmdLine({f.first, "value"});
      REQUIRE(cl.headers.size() == 1);
      CHECK(cl.headers[0].first == f.second);
      CHECK(cl.headers[0].second == "value");
    }
  }

  SUBCASE("double dash ends options") {
    auto cl = parseCmdLine({"-q", "--", "-5", "degrees", "--title"});
    CHECK(cl.quiet);
    CHECK(cl.words == vector<string>{"-5", "degrees", "--title"});
    CHECK(cl.headers.empty());
  }
}

TEST_CASE("runNtfy") {
  TmpDir td;
  Environment env = {{"NTFY_CONFIG", td.file("ntfy.conf")}};
  RecordingSender rs;
  Capture out, err;

  SUBCASE("show flags never send") {
    env["NTFY_TOPIC"] = "fromenv";
    CHECK(runNtfy({"-t"}, env, withStdin("ignored"), rs, out.f, err.f) == 0);
    CHECK(runNtfy({"-m"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(runNtfy({"--url"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(out.str() == "fromenv\nPOST\nhttps://ntfy.sh\n");
    CHECK(rs.requests.empty());
  }

  SUBCASE("setting a default persists it") {
    CHECK(runNtfy({"--set-topic", "ops"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(runNtfy({"--set-url", "https://push.example.org/"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(runNtfy({"--set-method", "GET"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(rs.requests.empty());
    CHECK(err.str().find("default topic set to ops") != string::npos);

    CHECK(runNtfy({"-t"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(out.str() == "ops\n");

    CHECK(runNtfy({"hello"}, env, noStdin(), rs, out.f, err.f) == 0);
    REQUIRE(rs.requests.size() == 1);
    CHECK(rs.requests[0].url == "https://push.example.org/ops");
    CHECK(rs.requests[0].method == "GET");
  }

  SUBCASE("show flags print values given earlier on the line") {
    CHECK(runNtfy({"-u", "https://push.example.org/x", "-u"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(runNtfy({"-t", "x", "-t"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(out.str() == "https://push.example.org/x\nx\n");
    CHECK(rs.requests.empty());
  }

  SUBCASE("setting a value with a newline fails and stores nothing") {
    CHECK(runNtfy({"--set-topic", "a\nb"}, env, noStdin(), rs, out.f, err.f) == 1);
    CHECK(!filesystem::exists(td.file("ntfy.conf")));
  }

  SUBCASE("setting an invalid method fails and stores nothing") {
    CHECK(runNtfy({"--set-method", "PUT"}, env, noStdin(), rs, out.f, err.f) == 1);
    CHECK(!filesystem::exists(td.file("ntfy.conf")));
  }

  SUBCASE("stdin beats arguments") {
    CHECK(runNtfy({"-t", "alerts", "from", "args"}, env, withStdin("from stdin"), rs, out.f, err.f) == 0);
    REQUIRE(rs.requests.size() == 1);
    CHECK(rs.requests[0].body == "from stdin");
    CHECK(rs.requests[0].url == "https://ntfy.sh/alerts");
    CHECK(rs.requests[0].method == "POST");
  }

  SUBCASE("success is reported with the message id") {
    CHECK(runNtfy({"--title", "Hi", "there"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(err.str() == "ntfy: message sent successfully (HTTP 200, id hGbyuZZUkTvZ)\n");
    REQUIRE(rs.requests.size() == 1);
    CHECK(rs.requests[0].headers == HeaderSet{{"Title", "Hi"}});
  }

  SUBCASE("quiet") {
    rs.result = {302, ""};
    CHECK(runNtfy({"-q", "there"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(err.str().empty());
  }

  SUBCASE("verbose") {
    CHECK(runNtfy({"-v", "--tags", "tada", "hi"}, env, noStdin(), rs, out.f, err.f) == 0);
    string e = err.str();
    CHECK(e.find("ntfy: POST https://ntfy.sh/general, 2 bytes, headers [") != string::npos);
    CHECK(e.find("Tags") != string::npos);
    CHECK(e.find("ntfy: recorder answered HTTP 200 after") != string::npos);
  }

  SUBCASE("invalid method sends nothing") {
    CHECK(runNtfy({"-m", "DELETE", "hello"}, env, noStdin(), rs, out.f, err.f) == 1);
    CHECK(rs.requests.empty());
    string e = err.str();
    CHECK(e.find("Method must be GET or POST (got \"DELETE\")") != string::npos);
    CHECK(e.find("Usage:") != string::npos);

    writeFile(td.file("ntfy.conf"), "NTFY_METHOD=PATCH\n");
    CHECK(runNtfy({"hello"}, env, noStdin(), rs, out.f, err.f) == 1);
    CHECK(rs.requests.empty());
  }

  SUBCASE("usage errors exit 1") {
    CHECK(runNtfy({"--bogus"}, env, noStdin(), rs, out.f, err.f) == 1);
    CHECK(runNtfy({"--title"}, env, noStdin(), rs, out.f, err.f) == 1);
    CHECK(runNtfy({}, env, noStdin(), rs, out.f, err.f) == 1);
    string e = err.str();
    CHECK(e.find("Unknown option: --bogus") != string::npos);
    CHECK(e.find("Missing argument for --title") != string::npos);
    CHECK(e.find("No message") != string::npos);
    CHECK(rs.requests.empty());
  }

  SUBCASE("unexpected status") {
    rs.result = {500, "oops"};
    CHECK(runNtfy({"-u", "https://hooks.example.com/x", "hello"}, env, noStdin(), rs, out.f, err.f) == 2);
    CHECK(err.str() == "ntfy: Unexpected HTTP status 500 from https://hooks.example.com/x\n");
  }

  SUBCASE("help and version") {
    CHECK(runNtfy({"--help"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(err.str().find("Usage: ntfy") != string::npos);
    CHECK(runNtfy({"--version"}, env, noStdin(), rs, out.f, err.f) == 0);
    CHECK(out.str() == fmt::format("ntfy-cli {}\n", NTFYCLI_VERSION));
    CHECK(rs.requests.empty());
  }

  SUBCASE("show config") {
    CHECK(runNtfy({"-t", "x", "--show-config"}, env, noStdin(), rs, out.f, err.f) == 0);
    string o = out.str();
    CHECK(o.find("topic: x\n") != string::npos);
    CHECK(o.find("target: https://ntfy.sh/x\n") != string::npos);
    CHECK(o.find("(not present)") != string::npos);
  }
}

TEST_CASE("against a local ntfy server") {
  TmpDir td;
  Environment env = {{"NTFY_CONFIG", td.file("ntfy.conf")}};
  CurlSender cs;
  Capture out, err;

  httplib::Server svr;
  string gotBody, gotTitle, gotAuth, gotMethod;
  svr.Post("/alerts", [&](const httplib::Request& req, httplib::Response& res) {
    gotMethod = "POST";
    gotBody = req.body;
    gotTitle = req.get_header_value("Title");
    gotAuth = req.get_header_value("Authorization");
    nlohmann::json j;
    j["id"] = "Xy12ab";
    j["event"] = "message";
    j["topic"] = "alerts";
    res.set_content(j.dump(), "application/json");
  });
  svr.Get("/alerts", [&](const httplib::Request& req, httplib::Response& res) {
    gotMethod = "GET";
    gotBody = req.body;
    res.set_content("ok", "text/plain");
  });
  int port = svr.bind_to_any_port("127.0.0.1");
  REQUIRE(port > 0);
  std::thread t([&svr]() { svr.listen_after_bind(); });
  string base = fmt::format("http://127.0.0.1:{}", port);
  env["NTFY_BASE_URL"] = base;

  SUBCASE("200") {
    CHECK(runNtfy({"-t", "alerts", "--title", "Backups", "--auth-bearer-token", "tk_abc"},
                  env, withStdin("all done"), cs, out.f, err.f) == 0);
    CHECK(gotMethod == "POST");
    CHECK(gotBody == "all done");
    CHECK(gotTitle == "Backups");
    CHECK(gotAuth == "Bearer tk_abc");
    CHECK(err.str() == "ntfy: message sent successfully (HTTP 200, id Xy12ab)\n");
  }

  SUBCASE("GET sends no body") {
    CHECK(runNtfy({"-t", "alerts", "-m", "GET", "ping"}, env, noStdin(), cs, out.f, err.f) == 0);
    CHECK(gotMethod == "GET");
    CHECK(gotBody.empty());
  }

  SUBCASE("404") {
    CHECK(runNtfy({"-u", base + "/nothing-here", "hello"}, env, noStdin(), cs, out.f, err.f) == 2);
    string e = err.str();
    CHECK(e.find("404") != string::npos);
    CHECK(e.find(base + "/nothing-here") != string::npos);
  }

  svr.stop();
  t.join();
}

TEST_CASE("transport failure surfaces the curl code") {
  TmpDir td;
  Environment env = {{"NTFY_CONFIG", td.file("ntfy.conf")}};
  CurlGlobal cg;
  CurlSender cs;
  Capture out, err;
  // nothing listens on port 1
  CHECK(runNtfy({"-u", "http://127.0.0.1:1/", "hello"}, env, noStdin(), cs, out.f, err.f) == CURLE_COULDNT_CONNECT);
  CHECK(err.str().find("http://127.0.0.1:1/general") != string::npos);
}
