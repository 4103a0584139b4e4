#include "config.hpp"

namespace grader {
using namespace std;

double TIME_LIMIT = 5;           // 5s
double BUILD_TIME_LIMIT = 60;    // 60s
size_t MEMORY_LIMIT = 1 << 20;   // 1G
size_t BUILD_MEMORY_LIMIT = 0;   // unlimited
size_t STREAM_SIZE = 1 << 20;    // 1M
size_t STEP_LIMIT = 1'000'000;
size_t CYCLE_HISTORY = 1 << 12;
size_t CYCLE_WINDOW = 8;

filesystem::path WORK_DIR = "/tmp/autograder";
#ifdef AUTOGRADER_TM_DIR
filesystem::path TM_DIR = AUTOGRADER_TM_DIR;
#else
filesystem::path TM_DIR = "tms";
#endif
bool DEBUG = false;

}  // namespace grader
