#include "config.hpp"

namespace ladder {

double DEFAULT_TIME_LIMIT = 5;     // 5s
int COMPILE_TIMEOUT_MS = 10000;    // 10s
bool DEBUG = false;

}  // namespace ladder
