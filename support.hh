#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct DTime
{
  DTime()
  {
    start();
  }
  void start()
  {
    d_start =   std::chrono::steady_clock::now();
  }
  uint32_t lapMsec()
  {
    auto msec = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()- d_start).count();
    start();
    return msec;
  }

  std::chrono::time_point<std::chrono::steady_clock> d_start;
};

std::string trimSpace(const std::string& str);
std::string stripQuotes(const std::string& str);
std::string joinWords(const std::vector<std::string>& words, const std::string& sep=" ");
bool startsWith(const std::string& str, const std::string& prefix);
