#pragma once

#include <string>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Last path component of a program name ("/usr/bin/foo" -> "foo").
std::string program_basename(const std::string& program);

// Local wall-clock time as HH:MM:SS.mmm, for log lines.
std::string now_log_stamp();
