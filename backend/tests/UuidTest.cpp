#include "utils/Uuid.hpp"

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

TEST_CASE("generate_uuid4 produces canonical version 4 ids")
{
    auto id = tb::utils::generate_uuid4();
    REQUIRE(id.size() == 36);
    CHECK(id[8] == '-');
    CHECK(id[13] == '-');
    CHECK(id[18] == '-');
    CHECK(id[23] == '-');
    CHECK(id[14] == '4');
    CHECK(std::string("89ab").find(id[19]) != std::string::npos);
    for (std::size_t i = 0; i < id.size(); ++i)
    {
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            continue;
        }
        CHECK(std::string("0123456789abcdef").find(id[i]) != std::string::npos);
    }
}

TEST_CASE("generate_uuid4 streams differ between threads")
{
    std::mutex mutex;
    std::set<std::string> ids;
    std::vector<std::thread> threads;
    for (int index = 0; index < 8; ++index)
    {
        threads.emplace_back(
            [&]()
            {
                std::vector<std::string> local;
                for (int item = 0; item < 500; ++item)
                {
                    local.push_back(tb::utils::generate_uuid4());
                }
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(local.begin(), local.end());
            });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }
    CHECK(ids.size() == 8 * 500);
}
