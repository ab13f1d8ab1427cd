// tests/test_main.cpp - GoogleTest entry point for DcaForge
#include <QCoreApplication>

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    // Qt SQL drivers and QSettings need an application instance
    QCoreApplication app(argc, argv);
    app.setApplicationName("DcaForgeTests");
    app.setOrganizationName("DcaForge");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
