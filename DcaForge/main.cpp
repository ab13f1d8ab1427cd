// src/main.cpp - DcaForge Command Line Entry Point
#include <QCoreApplication>

#include "core/Application.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // Application metadata, also the QSettings location
    app.setApplicationName("DcaForge");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("DcaForge");
    app.setOrganizationDomain("dcaforge.app");

    DcaForgeApplication dcaforge;
    return dcaforge.run(app.arguments());
}
