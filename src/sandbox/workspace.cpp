#include "sandbox/workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace funcjudge::sandbox {
using namespace std;

workspace::workspace(const filesystem::path &root) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    dir = root / uuid;

    error_code ec;
    filesystem::create_directories(dir, ec);
    if (ec) throw internal_error("unable to create workspace " + dir.string() + ": " + ec.message());
}

workspace::~workspace() {
    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "unable to remove workspace " << dir << ": " << ec.message();
}

const filesystem::path &workspace::path() const {
    return dir;
}

filesystem::path workspace::write_file(const string &name, const string &content) const {
    filesystem::path file = dir / assert_safe_path(name);
    write_file_content(file, content);
    return file;
}

}  // namespace funcjudge::sandbox
