#include "sandbox/workspace.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace() : owned(false) {}

workspace::workspace(const string &id, const fs::path &dir, const string &extension)
    : workspace_id(id), directory(dir), source_path(dir / ("main" + extension)), executable_path(dir / "main.out"), owned(true) {}

workspace::workspace(workspace &&other)
    : workspace_id(move(other.workspace_id)), directory(move(other.directory)), source_path(move(other.source_path)), executable_path(move(other.executable_path)), owned(other.owned) {
    other.owned = false;
}

workspace &workspace::operator=(workspace &&other) {
    if (this != &other) {
        release();
        workspace_id = move(other.workspace_id);
        directory = move(other.directory);
        source_path = move(other.source_path);
        executable_path = move(other.executable_path);
        owned = other.owned;
        other.owned = false;
    }
    return *this;
}

workspace::~workspace() {
    release();
}

const string &workspace::id() const {
    return workspace_id;
}

const fs::path &workspace::dir() const {
    return directory;
}

const fs::path &workspace::source_file() const {
    return source_path;
}

const fs::path &workspace::executable_file() const {
    return executable_path;
}

bool workspace::valid() const {
    return owned;
}

void workspace::release() noexcept {
    if (!owned) return;
    owned = false;
    error_code ec;
    fs::remove_all(directory, ec);
    if (ec)
        LOG(ERROR) << "Unable to remove workspace " << directory << ": " << ec.message();
    else
        VLOG(1) << "Workspace " << workspace_id << " released";
}

workspace_manager::workspace_manager(const fs::path &root)
    : root_dir(root) {}

string workspace_manager::generate_id() const {
    // uuid 的随机生成器不是线程安全的，每个线程使用自己的生成器
    thread_local boost::uuids::random_generator generator;
    string uuid = boost::lexical_cast<string>(generator());
    auto now = chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("exec_{}_{}_{}", now, getpid(), uuid.substr(0, 8));
}

workspace workspace_manager::acquire(const language_profile &profile, const string &source) {
    fs::create_directories(root_dir);

    string id = generate_id();
    fs::path dir = root_dir / id;
    if (!fs::create_directory(dir))
        throw fs::filesystem_error("workspace already exists", dir, make_error_code(errc::file_exists));

    workspace ws(id, dir, profile.extension);
    write_file_content(ws.source_file(), source);
    VLOG(1) << "Workspace " << id << " acquired at " << dir;
    return ws;
}

void workspace_manager::release(workspace &ws) noexcept {
    ws.release();
}

const fs::path &workspace_manager::root() const {
    return root_dir;
}

}  // namespace sandbox
