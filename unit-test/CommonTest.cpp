#include <thread>
#include "gtest/gtest.h"
#include "ojudge/common/concurrent_queue.hpp"
#include "ojudge/common/defer.hpp"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/json_utils.hpp"
#include "ojudge/common/utils.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace ojudge;
using nlohmann::json;

TEST(CommonTest, DeferRunsOnScopeExit) {
    int counter = 0;
    {
        defer { ++counter; };
        EXPECT_EQ(counter, 0);
    }
    EXPECT_EQ(counter, 1);
}

TEST(CommonTest, ConcurrentQueueDrainsAfterClose) {
    concurrent_queue<int> queue;
    EXPECT_FALSE(queue.try_pop());
    for (int i = 0; i < 100; ++i) queue.push(i);
    queue.close();

    int sum = 0;
    thread reader([&] {
        while (auto item = queue.pop()) sum += *item;
    });
    reader.join();
    EXPECT_EQ(sum, 4950);
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_FALSE(queue.pop());
}

TEST(CommonTest, SafePath) {
    EXPECT_EQ(assert_safe_path("259_bronze_cow_race"), "259_bronze_cow_race");
    EXPECT_THROW(assert_safe_path(""), invalid_argument);
    EXPECT_THROW(assert_safe_path(".."), invalid_argument);
    EXPECT_THROW(assert_safe_path("a/b"), invalid_argument);
}

TEST(CommonTest, FileContentAndLock) {
    test::temp_directory dir;
    auto file = dir.write("a.txt", "hello");
    EXPECT_EQ(read_file_content(file), "hello");
    EXPECT_THROW(read_file_content(dir.path() / "missing"), system_error);

    dir.mkdir("b");
    dir.mkdir("a");
    EXPECT_EQ(list_directories(dir.path()), (vector<string>{"a", "b"}));

    {
        auto lock = lock_directory(dir.path(), false);
        EXPECT_EQ(lock.file().string(), (dir.path() / ".lock").string());
    }
    // 锁释放后可以再次加锁
    auto shared1 = lock_directory(dir.path(), true);
    auto shared2 = lock_directory(dir.path(), true);
}

TEST(CommonTest, JsonAccess) {
    json j = {{"limits", {{"time", 2}, {"name", "x"}}}};
    EXPECT_EQ(nlohmann::access(j, "limits", "time").get<int>(), 2);
    EXPECT_TRUE(nlohmann::access_optional(j, "limits", "memory").is_null());
    EXPECT_EQ(nlohmann::access_optional(j, "limits", "name").get<std::string>(), "x");
    EXPECT_THROW(nlohmann::access(j, "missing"), invalid_argument);
    EXPECT_THROW(nlohmann::access(j, "limits", "time", "seconds"), invalid_argument);
}

TEST(CommonTest, ExceptionsCarryContext) {
    missing_test_data ex(3, missing_test_data::artifact::OUTPUT, "/problems/p/O.3");
    EXPECT_STREQ(ex.what(), "Missing output file for test case 3: /problems/p/O.3");

    internal_error internal("unable to create pipe");
    EXPECT_STREQ(internal.what(), "unable to create pipe");
}

TEST(CommonTest, MakeCommand) {
    std::filesystem::path script("/tmp/main.py");
    auto argv = make_command("python3", script, vector<string>{"-x", "1"});
    EXPECT_EQ(argv, (vector<string>{"python3", "/tmp/main.py", "-x", "1"}));
}
