#include <mutex>
#include <set>
#include <thread>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/workspace.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace sandbox;

class WorkspaceTest : public ::testing::Test {
protected:
    language_registry registry;
    engine_config config = test::make_test_config("workspace");
    workspace_manager manager{config.workspace_root};
};

TEST_F(WorkspaceTest, AcquireWritesSource) {
    workspace ws = manager.acquire(registry.lookup("cpp"), "int main() {}");
    ASSERT_TRUE(ws.valid());
    EXPECT_EQ(ws.dir().parent_path().string(), config.workspace_root.string());
    EXPECT_EQ(ws.dir().filename().string(), ws.id());
    EXPECT_EQ(ws.id().rfind("exec_", 0), 0u);
    EXPECT_EQ(ws.source_file().string(), (ws.dir() / "main.cpp").string());
    EXPECT_EQ(ws.executable_file().string(), (ws.dir() / "main.out").string());
    EXPECT_EQ(read_file_content(ws.source_file()), "int main() {}");
}

TEST_F(WorkspaceTest, DestructorReleases) {
    path dir;
    {
        workspace ws = manager.acquire(registry.lookup("python"), "print(1)");
        dir = ws.dir();
        write_file_content(ws.dir() / "artifact", "garbage");
        EXPECT_TRUE(exists(dir));
    }
    EXPECT_FALSE(exists(dir));
    EXPECT_EQ(test::count_files(config.workspace_root), 0);
}

TEST_F(WorkspaceTest, ReleaseIsIdempotent) {
    workspace ws = manager.acquire(registry.lookup("python"), "print(1)");
    manager.release(ws);
    EXPECT_FALSE(ws.valid());
    EXPECT_FALSE(exists(ws.dir()));
    ws.release();
    manager.release(ws);
    EXPECT_EQ(test::count_files(config.workspace_root), 0);
}

TEST_F(WorkspaceTest, MovedFromOwnsNothing) {
    workspace ws = manager.acquire(registry.lookup("python"), "print(1)");
    path dir = ws.dir();
    workspace moved = move(ws);
    EXPECT_FALSE(ws.valid());
    EXPECT_TRUE(moved.valid());

    ws.release();
    EXPECT_TRUE(exists(dir));
    moved.release();
    EXPECT_FALSE(exists(dir));
}

TEST_F(WorkspaceTest, UniqueAcrossThreads) {
    mutex mut;
    set<string> ids;
    vector<workspace> all;
    vector<thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 16; ++i) {
                workspace ws = manager.acquire(registry.lookup("python"), "print(1)");
                lock_guard<mutex> guard(mut);
                ids.insert(ws.id());
                all.push_back(move(ws));
            }
        });
    }
    for (auto &th : threads) th.join();

    EXPECT_EQ(ids.size(), 128u);
    EXPECT_EQ(test::count_files(config.workspace_root), 128);
    all.clear();
    EXPECT_EQ(test::count_files(config.workspace_root), 0);
}
