#include "codejudge/sandbox/workspace.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <glog/logging.h>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

workspace::workspace()
    : workspace(RUN_DIR) {}

workspace::workspace(const filesystem::path &parent) {
    // random_generator 不是线程安全的，每次创建新的生成器
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    dir = parent / uuid;
    error_code ec;
    filesystem::create_directories(dir, ec);
    if (ec)
        throw internal_error("Unable to create directory " + dir.string() + ": " + ec.message());
}

workspace::~workspace() {
    if (DEBUG) {
        LOG(INFO) << "Keeping workspace " << dir << " in debug mode";
        return;
    }
    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove workspace " << dir << ": " << ec.message();
}

const filesystem::path &workspace::path() const {
    return dir;
}

}  // namespace codejudge
