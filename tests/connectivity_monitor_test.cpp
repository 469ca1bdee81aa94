#include <QObject>
#include <gtest/gtest.h>
#include <memory>

import porter.services.connectivity_monitor;

TEST(ConnectivityMonitor, RunsImmediatelyWhenOnline)
{
    ConnectivityMonitor monitor;
    EXPECT_TRUE(monitor.isOnline());

    QObject context;
    int runs = 0;
    monitor.whenOnline(&context, [&runs]() { ++runs; });
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(monitor.pendingCount(), 0);
}

TEST(ConnectivityMonitor, DefersUntilRestored)
{
    ConnectivityMonitor monitor;
    monitor.setSystemOnline(false);

    int restored = 0;
    QObject::connect(&monitor, &ConnectivityMonitor::connectivityRestored, [&restored]() { ++restored; });

    QObject context;
    int runs = 0;
    monitor.whenOnline(&context, [&runs]() { ++runs; });
    monitor.whenOnline(&context, [&runs]() { ++runs; });
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(monitor.pendingCount(), 2);

    monitor.setSystemOnline(true);
    EXPECT_EQ(runs, 2);
    EXPECT_EQ(restored, 1);
    EXPECT_EQ(monitor.pendingCount(), 0);
}

TEST(ConnectivityMonitor, ForcedOfflineOverridesSystem)
{
    ConnectivityMonitor monitor;
    monitor.setForcedOffline(true);
    EXPECT_FALSE(monitor.isOnline());
    EXPECT_TRUE(monitor.isSystemOnline());

    QObject context;
    int runs = 0;
    monitor.whenOnline(&context, [&runs]() { ++runs; });

    monitor.setSystemOnline(false);
    monitor.setSystemOnline(true);
    EXPECT_EQ(runs, 0);

    monitor.setForcedOffline(false);
    EXPECT_EQ(runs, 1);
}

TEST(ConnectivityMonitor, SkipsContinuationsOfDestroyedContexts)
{
    ConnectivityMonitor monitor;
    monitor.setSystemOnline(false);

    int runs = 0;
    auto context = std::make_unique<QObject>();
    monitor.whenOnline(context.get(), [&runs]() { ++runs; });
    context.reset();

    monitor.setSystemOnline(true);
    EXPECT_EQ(runs, 0);
}
