#include "config.hpp"
#include <limits>
#include <stdexcept>

namespace coderun {
using namespace std;

int64_t MEMORY_LIMIT = 128ll << 20;  // 128M
int TIME_LIMIT = 10;                 // 10s
int PROC_LIMIT = 64;
int64_t OUTPUT_LIMIT = 1ll << 20;    // 1M
size_t MAX_CONCURRENCY = 5;
size_t MAX_CODE_CHARS = 5000;
size_t MAX_HISTORY = 100;
size_t HISTORY_CODE_CHARS = 2000;

filesystem::path RUN_DIR = "/tmp";
string DOCKER = "docker";

int64_t kilobytes_to_bytes(int64_t kilobytes, const string &name) {
    if (kilobytes <= 0 || kilobytes > (numeric_limits<int64_t>::max() >> 10))
        throw invalid_argument(name + " should be a positive number of KB");
    return kilobytes << 10;
}

void check_settings() {
    if (MEMORY_LIMIT <= 0)
        throw invalid_argument("Memory limit should be positive");
    if (TIME_LIMIT <= 0)
        throw invalid_argument("Time limit should be positive");
    if (OUTPUT_LIMIT <= 0)
        throw invalid_argument("Output limit should be positive");
    if (MAX_CONCURRENCY == 0 || MAX_CONCURRENCY > (size_t)numeric_limits<int64_t>::max())
        throw invalid_argument("Concurrency should be positive");
}

}  // namespace coderun
