#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QPointer>

#include "core/ViewportSettings.h"
#include "core/ResolutionSync.h"

class QAction;
class QCloseEvent;
class QLabel;
class QScrollBar;
class PageViewport;

/**
 * @brief Demo shell around one PageViewport.
 *
 * Toolbar: zoom out, zoom %, zoom in, fit width, recenter, pan tool.
 * Status bar: fit mode and the physical resolution handed to the drawing engine.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const ViewportSettings& settings, QWidget* parent = nullptr);
    ~MainWindow() override = default;

    PageViewport* viewport() const { return m_viewport; }

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void updateZoomDisplay(int percent);
    void updateResolutionDisplay(const PhysicalResolution& resolution);
    void updateScrollBars(qreal horizontal, qreal vertical);

private:
    void setupUi();
    void setupToolbar();

    PageViewport* m_viewport = nullptr;

    // ===== Chrome =====
    QLabel* m_zoomLabel = nullptr;
    QLabel* m_modeLabel = nullptr;
    QLabel* m_resolutionLabel = nullptr;
    QScrollBar* m_hScroll = nullptr;
    QScrollBar* m_vScroll = nullptr;
    QAction* m_panToolAction = nullptr;

    static constexpr int SCROLLBAR_RANGE = 1000;
};

#endif // MAINWINDOW_H
