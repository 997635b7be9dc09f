#include <gtest/gtest.h>
#include "core/port_pool.hpp"

using namespace neolan::core;

TEST(PortPoolTest, AcquireWithinRange) {
    PortPool pool(8000, 8002);
    EXPECT_EQ(pool.capacity(), 3u);

    auto a = pool.acquire();
    auto b = pool.acquire();
    auto c = pool.acquire();
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*a, 8000);
    EXPECT_EQ(*b, 8001);
    EXPECT_EQ(*c, 8002);

    EXPECT_FALSE(pool.acquire().has_value());
    EXPECT_EQ(pool.in_use_count(), 3u);
}

TEST(PortPoolTest, ReleaseMakesPortAvailable) {
    PortPool pool(8000, 8001);
    auto a = pool.acquire();
    auto b = pool.acquire();
    ASSERT_TRUE(a && b);

    pool.release(*a);
    EXPECT_FALSE(pool.in_use(*a));
    EXPECT_TRUE(pool.in_use(*b));

    auto again = pool.acquire();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *a);
}

TEST(PortPoolTest, RoundRobinSkipsBusyPorts) {
    PortPool pool(9000, 9003);
    auto p0 = pool.acquire();
    auto p1 = pool.acquire();
    ASSERT_TRUE(p0 && p1);
    pool.release(*p0);

    // 继续向后轮转而不是立即复用刚释放的端口
    auto p2 = pool.acquire();
    ASSERT_TRUE(p2.has_value());
    EXPECT_EQ(*p2, 9002);
}

TEST(PortPoolTest, DoubleReleaseIsHarmless) {
    PortPool pool(8000, 8000);
    auto p = pool.acquire();
    ASSERT_TRUE(p.has_value());
    pool.release(*p);
    pool.release(*p);
    EXPECT_EQ(pool.in_use_count(), 0u);
    EXPECT_TRUE(pool.acquire().has_value());
}
