#include "support.hh"

using namespace std;

string trimSpace(const string& str)
{
  string line = str;
  auto pos = line.find_last_not_of(" \t\r\n\x1a");
  if(pos != string::npos)
    line.resize(pos+1);
  else
    return "";
  pos = line.find_first_not_of(" \t");
  if(pos != string::npos)
    line = line.substr(pos);
  return line;
}

// 'value' and "value" both become value, anything else is left alone
string stripQuotes(const string& str)
{
  if(str.size() >= 2 && (str.front() == '"' || str.front() == '\'') && str.back() == str.front())
    return str.substr(1, str.size() - 2);
  return str;
}

string joinWords(const vector<string>& words, const string& sep)
{
  string ret;
  for(auto iter = words.cbegin(); iter != words.cend(); ++iter) {
    if(iter != words.cbegin())
      ret += sep;
    ret += *iter;
  }
  return ret;
}

bool startsWith(const string& str, const string& prefix)
{
  return str.rfind(prefix, 0) == 0;
}
