#include "log.hpp"
#include <cstdlib>

extern "C" {
int debug_level = 0;
}

void runbox::init_debug_level_from_env() {
  debug_level = getenv("DEBUG") ? 10 : 0;
}

void runbox::set_debug_level(int level) {
  debug_level = level;
}
