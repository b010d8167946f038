#pragma once

#include <cstddef>

namespace sift::util {

// getenv that accepts both SIFT_ and sift_ spellings of a variable.
// Returns nullptr for unset or empty values.
const char* getenv_compat(const char* name);

size_t getenv_size(const char* name, size_t defv);
bool env_flag(const char* name, bool defv);

} // namespace sift::util
