#include "mainwindow.h"
#include <QApplication>
#include <QStyleFactory>
#include <iostream>

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);

    QCoreApplication::setApplicationName("RoiThumb");
    QCoreApplication::setApplicationVersion("1.0.0");
    QCoreApplication::setOrganizationName("RoiThumb");

    app.setStyle(QStyleFactory::create("Fusion"));

    QPalette darkPalette;
    darkPalette.setColor(QPalette::Window, QColor(53, 53, 53));
    darkPalette.setColor(QPalette::WindowText, Qt::white);
    darkPalette.setColor(QPalette::Base, QColor(25, 25, 25));
    darkPalette.setColor(QPalette::AlternateBase, QColor(53, 53, 53));
    darkPalette.setColor(QPalette::Text, Qt::white);
    darkPalette.setColor(QPalette::Button, QColor(53, 53, 53));
    darkPalette.setColor(QPalette::ButtonText, Qt::white);
    darkPalette.setColor(QPalette::Highlight, QColor(42, 130, 218));
    darkPalette.setColor(QPalette::HighlightedText, Qt::black);
    app.setPalette(darkPalette);

    std::cout << "Starting RoiThumb..." << std::endl;

    roithumb::MainWindow mainWindow;
    mainWindow.show();

    const QStringList args = QCoreApplication::arguments();
    if (args.size() > 1) {
        mainWindow.openRois(args.at(1).toStdString());
    }
    if (args.size() > 2) {
        mainWindow.openImageStack(args.at(2).toStdString());
    }

    return app.exec();
}
