#include <gtest/gtest.h>

#include <QCoreApplication>

// Qt Sql drivers and QSettings need an application instance.
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
