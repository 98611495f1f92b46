#pragma once

#include "config.h"
#include "dashboard.h"
#include "image_stack.h"
#include "roi_group.h"

#include <QMainWindow>
#include <QLabel>
#include <QListWidget>

#include <filesystem>
#include <memory>

namespace roithumb {

class RoiThumbnailDisplay;
class RoiThumbnailWidget;

/**
 * Viewer window: roi list on the left, thumbnail of the selected roi on the right
 */
class MainWindow : public QMainWindow, public Dashboard {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    Config& getConfig() { return m_config; }
    RoiGroup& getRoiGroup() { return m_roiGroup; }

    bool openRois(const std::filesystem::path& path);
    bool openImageStack(const std::filesystem::path& path);

    void displayMessage(const QString& message) override;
    void updateStatusBar(const QString& message);

private slots:
    void onOpenRois();
    void onOpenImageStack();
    void onListSelectionChanged();

private:
    void setupUi();
    void rebuildRoiList();

    Config m_config;
    RoiGroup m_roiGroup;
    TiffImageStack m_imageStack;

    // UI elements
    QListWidget* m_roiList = nullptr;
    RoiThumbnailWidget* m_thumbnailWidget = nullptr;
    QLabel* m_statusLabel = nullptr;

    std::unique_ptr<RoiThumbnailDisplay> m_thumbnailDisplay;
};

} // namespace roithumb
