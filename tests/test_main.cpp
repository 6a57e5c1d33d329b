#include <QCoreApplication>

#include <gtest/gtest.h>

// Timers and the thread pool need a Qt application object.
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
