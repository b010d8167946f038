#include "util/Env.hpp"
#include <cstdlib>
#include <exception>
#include <string>

namespace sift::util {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SIFT_", 0) == 0) {
    alt = std::string("sift_") + n.substr(5);
  } else if (n.rfind("sift_", 0) == 0) {
    alt = std::string("SIFT_") + n.substr(5);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

size_t getenv_size(const char* name, size_t defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return static_cast<size_t>(std::stoull(v)); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

} // namespace sift::util
