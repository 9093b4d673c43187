#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path STORE_DIR;
filesystem::path CACHE_DIR;
filesystem::path RUN_DIR = filesystem::temp_directory_path() / "grader";
filesystem::path RUNGUARD = "runguard";
size_t MAX_OUTPUT_BYTES = 1 << 20;  // 1M
bool DEBUG = false;

}  // namespace grader
