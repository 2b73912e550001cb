#include "codejudge/config.hpp"
#include <algorithm>
#include <thread>

namespace codejudge {
using namespace std;

filesystem::path RUN_DIR = filesystem::temp_directory_path() / "codejudge";
double DEFAULT_TIME_LIMIT = 5;      // 5s
double COMPILE_TIME_LIMIT = 10;     // 10s
size_t OUTPUT_LIMIT = 64 << 20;     // 64M
size_t MAX_PROCESSES = max(1u, thread::hardware_concurrency());
size_t WORKERS = max(1u, thread::hardware_concurrency());
bool DEBUG = false;

}  // namespace codejudge
