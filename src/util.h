#pragma once

#include <array>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>

using namespace std;

// Prints as [a, b, ...] in default float notation, whatever the stream's flags
template<typename T, size_t N> ostream& operator<<(ostream& out, const array<T, N>& v)
{
  out << "[";
  for (size_t i = 0; i < N; ++i) {
    ostringstream ss;
    ss << v[i];
    out << ss.str();
    if (i != N - 1)
      out << ", ";
  }
  out << "]";
  return out;
}

inline bool file_exists(const string& fname)
{
  struct stat buffer;
  return (stat(fname.c_str(), &buffer) == 0);
}

inline string read_file(const string& path)
{
  ifstream input_file(path);
  if (!input_file.is_open())
    throw runtime_error("Could not open the file - '" + path + "'");
  return string{istreambuf_iterator<char>{input_file}, {}};
}
