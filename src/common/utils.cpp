#include "codejudge/common/utils.hpp"
#include <stdlib.h>

namespace codejudge {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return duration<chrono::duration<double, milli>>().count();
}

}  // namespace codejudge
