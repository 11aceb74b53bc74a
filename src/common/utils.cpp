#include "common/utils.hpp"
#include <stdlib.h>

namespace sandbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

chrono::steady_clock::time_point elapsed_time::started_at() const {
    return start;
}

}  // namespace sandbox
