#include "ntfy.hh"
#include "sender.hh"
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <unistd.h>
#include <fmt/format.h>

using namespace std;

static Environment getEnvironment()
{
  Environment env;
  for(const char* name : {"NTFY_BASE_URL", "NTFY_TOPIC", "NTFY_CONFIG", "XDG_CONFIG_HOME", "HOME"}) {
    if(auto ptr = getenv(name))
      env[name] = ptr;
  }
  return env;
}

static std::optional<string> readStdin()
{
  if(isatty(STDIN_FILENO))
    return std::optional<string>();
  string ret{istreambuf_iterator<char>(std::cin), istreambuf_iterator<char>()};
  return ret;
}

int main(int argc, char **argv)
try
{
  CurlGlobal cg;
  CurlSender sender;
  vector<string> args(argv + 1, argv + argc);
  return runNtfy(args, getEnvironment(), readStdin, sender, stdout, stderr);
}
catch(DeliveryError& e)
{
  fmt::print(stderr, "ntfy: {}\n", e.what());
  return e.getExitCode();
}
catch(std::exception& e)
{
  fmt::print(stderr, "ntfy: fatal error: {}\n", e.what());
  return EXIT_FAILURE;
}
