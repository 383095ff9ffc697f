#ifndef MAINWINDOW_HPP
#define MAINWINDOW_HPP

#include <QMainWindow>
#include <QImage>
#include <memory>
#include "types.hpp"
#include "voxelizer.hpp"
#include "grid_query.hpp"

class QLineEdit;
class QPushButton;
class QDoubleSpinBox;
class QSpinBox;
class QComboBox;
class QCheckBox;
class QLabel;
class QTextEdit;
class QProgressBar;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override = default;

    // Shows the grid; called with the result GridSession accepted
    void setResult(std::shared_ptr<const voxgrid::VoxelizeResult> result);

    // Plane rows run along image x, plane columns bottom-up along image y.
    // Counts map to gray above threshold; category ranks use the label palette.
    static QImage renderPlane(const voxgrid::Plane& plane, voxgrid::GridLayer layer,
                              double threshold);

signals:
    void voxelizeRequested(const QString& inputPath, double voxelSize, bool hasHeader);

public slots:
    void onProgressChanged(int percent);
    void onLogMessage(const QString& message);
    void onVoxelizeFinished(bool success, const QString& error);

private slots:
    void browseInput();
    void requestVoxelize();
    void updateView();

private:
    void setupUi();
    void updateIndexRange();
    void showImage(QLabel* label, const QImage& image);

    // Input widgets
    QLineEdit* m_inputPathEdit;
    QPushButton* m_browseInputBtn;
    QCheckBox* m_headerCheck;

    // Settings widgets
    QDoubleSpinBox* m_voxelSizeSpin;
    QDoubleSpinBox* m_thresholdSpin;
    QComboBox* m_axisCombo;
    QSpinBox* m_indexSpin;
    QComboBox* m_layerCombo;

    // View widgets
    QLabel* m_sliceLabel;
    QLabel* m_mipLabel;
    QLabel* m_infoLabel;

    // Log and progress widgets
    QTextEdit* m_logEdit;
    QProgressBar* m_progressBar;
    QPushButton* m_voxelizeBtn;

    std::shared_ptr<const voxgrid::VoxelizeResult> m_result;
    std::unique_ptr<voxgrid::GridQuery> m_query;
};

#endif // MAINWINDOW_HPP
