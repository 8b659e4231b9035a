#include "engine/workspace.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <ctime>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace quest::engine {
using namespace std;
namespace fs = std::filesystem;

static const string WORKSPACE_PREFIX = "quest-";

void active_workspaces::add(const fs::path &dir) {
    scoped_lock guard(mut);
    dirs.insert(dir);
}

void active_workspaces::remove(const fs::path &dir) {
    scoped_lock guard(mut);
    dirs.erase(dir);
}

bool active_workspaces::contains(const fs::path &dir) const {
    scoped_lock guard(mut);
    return dirs.count(dir) > 0;
}

size_t active_workspaces::size() const {
    scoped_lock guard(mut);
    return dirs.size();
}

workspace::workspace() {}

workspace::workspace(fs::path dir, shared_ptr<active_workspaces> registry)
    : dir(move(dir)), registry(move(registry)) {
    if (this->registry) this->registry->add(this->dir);
}

workspace::workspace(workspace &&other) noexcept
    : dir(move(other.dir)), registry(move(other.registry)) {
    other.dir.clear();
}

workspace::~workspace() {
    close();
}

workspace &workspace::operator=(workspace &&other) noexcept {
    if (this != &other) {
        close();
        dir = move(other.dir);
        registry = move(other.registry);
        other.dir.clear();
    }
    return *this;
}

const fs::path &workspace::root() const {
    return dir;
}

bool workspace::is_open() const {
    return !dir.empty();
}

fs::path workspace::resolve(const string &filename) const {
    if (!is_open()) throw internal_error("workspace is closed");
    return dir / assert_safe_path(filename);
}

fs::path workspace::write(const string &filename, const string &content) {
    fs::path path = resolve(filename);
    write_file_content(path, content);
    return path;
}

void workspace::close() noexcept {
    if (dir.empty()) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(WARNING) << "unable to remove workspace " << dir << ": " << ec.message();
    else
        VLOG(1) << "workspace " << dir << " removed";
    if (registry) registry->remove(dir);
    dir.clear();
    registry.reset();
}

workspace_manager::workspace_manager(fs::path root)
    : root_dir(move(root)), active(make_shared<active_workspaces>()) {}

workspace_manager::~workspace_manager() {
    stop_sweeper();
}

const fs::path &workspace_manager::root() const {
    return root_dir;
}

workspace workspace_manager::open() {
    // boost::uuids::random_generator 不是线程安全的，每个线程使用自己的生成器
    thread_local boost::uuids::random_generator generator;

    error_code ec;
    fs::create_directories(root_dir, ec);
    if (ec)
        throw internal_error("unable to create workspace root " + root_dir.string() + ": " + ec.message());

    fs::path dir = root_dir / (WORKSPACE_PREFIX + boost::lexical_cast<string>(generator()));
    if (!fs::create_directory(dir, ec))
        throw internal_error("unable to create workspace " + dir.string() + (ec ? ": " + ec.message() : ": already exists"));
    VLOG(1) << "workspace " << dir << " opened";
    return workspace(dir, active);
}

size_t workspace_manager::sweep_orphans(chrono::seconds max_age) {
    error_code ec;
    if (!fs::is_directory(root_dir, ec)) return 0;

    time_t now = time(nullptr);
    size_t removed = 0;
    for (auto &entry : fs::directory_iterator(root_dir, ec)) {
        const fs::path &path = entry.path();
        if (!entry.is_directory(ec) || !boost::starts_with(path.filename().string(), WORKSPACE_PREFIX))
            continue;
        if (active->contains(path)) continue;

        try {
            if (now - last_write_time(path) < max_age.count()) continue;
        } catch (std::system_error &) {
            // 目录可能在遍历时被正常删除
            continue;
        }

        fs::remove_all(path, ec);
        if (ec) {
            LOG(WARNING) << "unable to remove orphan workspace " << path << ": " << ec.message();
        } else {
            LOG(INFO) << "removed orphan workspace " << path;
            ++removed;
        }
    }
    return removed;
}

void workspace_manager::start_sweeper(chrono::seconds interval, chrono::seconds max_age) {
    stop_sweeper();
    stopping = false;
    sweeper = thread([this, interval, max_age] {
        unique_lock<mutex> lock(sweeper_mutex);
        while (!stopping) {
            lock.unlock();
            size_t removed = sweep_orphans(max_age);
            if (removed > 0) LOG(INFO) << "workspace sweeper removed " << removed << " orphans";
            lock.lock();
            sweeper_cond.wait_for(lock, interval, [this] { return stopping; });
        }
    });
}

void workspace_manager::stop_sweeper() {
    {
        scoped_lock guard(sweeper_mutex);
        stopping = true;
    }
    sweeper_cond.notify_all();
    if (sweeper.joinable()) sweeper.join();
}

size_t workspace_manager::active_count() const {
    return active->size();
}

}  // namespace quest::engine
