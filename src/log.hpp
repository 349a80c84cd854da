#pragma once

// log.h prints the OpenMP thread number in front of each line
#ifdef _OPENMP
#include <omp.h>
#endif

extern "C" {
#include "log.h"
}

namespace runbox {
  // DEBUG set in the environment turns on every level
  void init_debug_level_from_env();
  void set_debug_level(int level);
}
