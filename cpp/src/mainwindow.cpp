#include "mainwindow.h"
#include "roi_image.h"
#include "roi_io.h"
#include "roi_thumbnail_display.h"
#include "roi_thumbnail_widget.h"

#include <QAction>
#include <QApplication>
#include <QFileDialog>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QSignalBlocker>
#include <QSplitter>
#include <QVBoxLayout>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace roithumb {

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_config(Config::load())
    , m_imageStack(m_config.cacheFrames)
{
    setupUi();

    RoiThumbnailOptions options;
    options.upsampleFactor = m_config.upsampleFactor;
    options.minFrameCount = m_config.minFrameCount;
    m_thumbnailDisplay = std::make_unique<RoiThumbnailDisplay>(
        m_roiGroup, *m_thumbnailWidget, &computeRoiThumbnail, options);
    m_thumbnailDisplay->setDashboard(this);

    if (!m_config.roiPath.empty()) {
        openRois(m_config.roiPath);
    }
    if (!m_config.imageStackPath.empty()) {
        openImageStack(m_config.imageStackPath);
    }
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    setWindowTitle("RoiThumb");
    setGeometry(100, 100, 720, 480);

    QMenu* fileMenu = menuBar()->addMenu("File");
    QAction* openRoisAction = fileMenu->addAction("Open Rois...");
    QAction* openStackAction = fileMenu->addAction("Open Image Stack...");
    fileMenu->addSeparator();
    QAction* quitAction = fileMenu->addAction("Quit");
    connect(openRoisAction, &QAction::triggered, this, &MainWindow::onOpenRois);
    connect(openStackAction, &QAction::triggered, this, &MainWindow::onOpenImageStack);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QWidget* centralWidget = new QWidget(this);
    QVBoxLayout* mainLayout = new QVBoxLayout(centralWidget);

    QSplitter* splitter = new QSplitter(Qt::Horizontal, this);

    m_roiList = new QListWidget(this);
    m_roiList->setSelectionMode(QAbstractItemView::ExtendedSelection);
    connect(m_roiList, &QListWidget::itemSelectionChanged, this, &MainWindow::onListSelectionChanged);

    m_thumbnailWidget = new RoiThumbnailWidget(this);
    m_thumbnailWidget->setLineWidth(m_config.lineWidth);
    m_thumbnailWidget->setLineColor(QColor(m_config.lineColor[0], m_config.lineColor[1], m_config.lineColor[2]));

    splitter->addWidget(m_roiList);
    splitter->addWidget(m_thumbnailWidget);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 2);

    m_statusLabel = new QLabel("Ready");
    m_statusLabel->setStyleSheet("background-color: black; color: white; padding: 5px;");
    m_statusLabel->setFixedHeight(30);

    mainLayout->addWidget(splitter);
    mainLayout->addWidget(m_statusLabel);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(0);

    setCentralWidget(centralWidget);
}

void MainWindow::updateStatusBar(const QString& message) {
    if (m_statusLabel) {
        m_statusLabel->setText(message);
    }
}

void MainWindow::displayMessage(const QString& message) {
    updateStatusBar(message);
}

bool MainWindow::openRois(const std::filesystem::path& path) {
    std::vector<Roi> rois;
    QString error;
    if (!roi_io::loadJson(path, rois, &error)) {
        std::cerr << "Failed to load rois from " << path << ": " << error.toStdString() << std::endl;
        updateStatusBar("Failed to load rois: " + error);
        return false;
    }

    m_roiGroup.setRois(std::move(rois));
    rebuildRoiList();

    std::cout << "Loaded " << m_roiGroup.roiCount() << " rois from: " << path << std::endl;
    updateStatusBar(QString("Loaded %1 rois").arg(m_roiGroup.roiCount()));
    return true;
}

bool MainWindow::openImageStack(const std::filesystem::path& path) {
    updateStatusBar("Loading image stack: " + QString::fromStdString(path.filename().string()));
    QApplication::processEvents();
    QApplication::setOverrideCursor(Qt::WaitCursor);

    const bool opened = m_imageStack.open(path);
    QApplication::restoreOverrideCursor();

    if (!opened) {
        m_thumbnailDisplay->setImageStack(nullptr);
        updateStatusBar("Failed to open image stack: " + QString::fromStdString(m_imageStack.getLastError()));
        return false;
    }

    m_thumbnailDisplay->setImageStack(&m_imageStack);
    updateStatusBar(QString("Image stack: %1 frames in memory").arg(m_imageStack.cachedFrameCount()));
    return true;
}

void MainWindow::onOpenRois() {
    const QString file = QFileDialog::getOpenFileName(
        this, "Open Rois", QString(), "Roi files (*.json);;All files (*)");
    if (file.isEmpty()) return;
    openRois(std::filesystem::path(file.toStdString()));
}

void MainWindow::onOpenImageStack() {
    const QString file = QFileDialog::getOpenFileName(
        this, "Open Image Stack", QString(), "TIFF stacks (*.tif *.tiff);;All files (*)");
    if (file.isEmpty()) return;
    openImageStack(std::filesystem::path(file.toStdString()));
}

void MainWindow::rebuildRoiList() {
    const QSignalBlocker blocker(m_roiList);
    m_roiList->clear();
    for (int i = 0; i < m_roiGroup.roiCount(); ++i) {
        const Roi& roi = m_roiGroup.roiAt(i);
        QString text = roi.id;
        if (!roi.classification.isEmpty()) {
            text += QString(" (%1)").arg(roi.classification);
        }
        m_roiList->addItem(text);
    }
}

void MainWindow::onListSelectionChanged() {
    // The current row goes last, it is the roi the thumbnail shows
    std::vector<int> indices;
    for (const QModelIndex& index : m_roiList->selectionModel()->selectedIndexes()) {
        indices.push_back(index.row());
    }
    const int current = m_roiList->currentRow();
    auto it = std::find(indices.begin(), indices.end(), current);
    if (it != indices.end()) {
        indices.erase(it);
        indices.push_back(current);
    }

    try {
        m_roiGroup.setSelection(indices);
    } catch (const std::out_of_range& e) {
        std::cerr << "Invalid roi selection: " << e.what() << std::endl;
        QMessageBox::warning(this, "Error", QString("Invalid roi selection:\n%1").arg(e.what()));
    }
}

} // namespace roithumb
