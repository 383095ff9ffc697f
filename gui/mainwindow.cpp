#include "mainwindow.hpp"
#include "errors.hpp"

#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPixmap>
#include <QProgressBar>
#include <QPushButton>
#include <QSpinBox>
#include <QTextEdit>
#include <QTime>
#include <QVBoxLayout>

namespace {

// Indexed by category id
const QRgb kCategoryColors[voxgrid::kCategoryCount] = {
    qRgb(0xd4, 0xa5, 0x74),  // terrain
    qRgb(0xbd, 0xbd, 0xbd),  // building
    qRgb(0x4a, 0x4a, 0x4a),  // road
    qRgb(0x2e, 0x7d, 0x32),  // vegetation
    qRgb(0x19, 0x76, 0xd2),  // water
    qRgb(0x9c, 0x27, 0xb0),  // unknown
};

const QRgb kEmptyColor = qRgb(0, 0, 0);

} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent) {
    setWindowTitle("voxgrid Viewer");
    resize(900, 700);
    setupUi();
}

void MainWindow::setupUi() {
    auto* centralWidget = new QWidget(this);
    auto* mainLayout = new QVBoxLayout(centralWidget);
    mainLayout->setContentsMargins(12, 12, 12, 12);
    mainLayout->setSpacing(10);

    // Input row
    auto* inputLayout = new QHBoxLayout();
    inputLayout->addWidget(new QLabel("Points:"));
    m_inputPathEdit = new QLineEdit();
    m_inputPathEdit->setPlaceholderText("CSV or PLY file (empty: synthetic sphere shell)");
    inputLayout->addWidget(m_inputPathEdit, 1);
    m_browseInputBtn = new QPushButton("Browse...");
    inputLayout->addWidget(m_browseInputBtn);
    m_headerCheck = new QCheckBox("CSV header");
    m_headerCheck->setChecked(true);
    inputLayout->addWidget(m_headerCheck);
    mainLayout->addLayout(inputLayout);

    // Settings group
    auto* settingsGroup = new QGroupBox("Settings");
    auto* settingsLayout = new QHBoxLayout(settingsGroup);

    settingsLayout->addWidget(new QLabel("Voxel size:"));
    m_voxelSizeSpin = new QDoubleSpinBox();
    m_voxelSizeSpin->setRange(0.01, 1000.0);
    m_voxelSizeSpin->setValue(2.0);
    m_voxelSizeSpin->setDecimals(2);
    settingsLayout->addWidget(m_voxelSizeSpin);

    settingsLayout->addSpacing(12);
    settingsLayout->addWidget(new QLabel("Threshold:"));
    m_thresholdSpin = new QDoubleSpinBox();
    m_thresholdSpin->setRange(0.0, 1000000.0);
    m_thresholdSpin->setValue(5.0);
    m_thresholdSpin->setDecimals(1);
    settingsLayout->addWidget(m_thresholdSpin);

    settingsLayout->addSpacing(12);
    settingsLayout->addWidget(new QLabel("Axis:"));
    m_axisCombo = new QComboBox();
    m_axisCombo->addItems({"X", "Y", "Z"});
    m_axisCombo->setCurrentIndex(2);
    settingsLayout->addWidget(m_axisCombo);

    settingsLayout->addWidget(new QLabel("Index:"));
    m_indexSpin = new QSpinBox();
    m_indexSpin->setRange(0, 0);
    settingsLayout->addWidget(m_indexSpin);

    settingsLayout->addSpacing(12);
    settingsLayout->addWidget(new QLabel("Layer:"));
    m_layerCombo = new QComboBox();
    m_layerCombo->addItems({"counts", "category"});
    settingsLayout->addWidget(m_layerCombo);
    settingsLayout->addStretch();

    m_voxelizeBtn = new QPushButton("Voxelize");
    m_voxelizeBtn->setMinimumWidth(120);
    settingsLayout->addWidget(m_voxelizeBtn);

    mainLayout->addWidget(settingsGroup);

    // Slice and projection views
    auto* viewLayout = new QHBoxLayout();
    auto* sliceGroup = new QGroupBox("Slice");
    auto* sliceLayout = new QVBoxLayout(sliceGroup);
    m_sliceLabel = new QLabel();
    m_sliceLabel->setMinimumSize(300, 300);
    m_sliceLabel->setAlignment(Qt::AlignCenter);
    sliceLayout->addWidget(m_sliceLabel);
    viewLayout->addWidget(sliceGroup, 1);

    auto* mipGroup = new QGroupBox("Max projection");
    auto* mipLayout = new QVBoxLayout(mipGroup);
    m_mipLabel = new QLabel();
    m_mipLabel->setMinimumSize(300, 300);
    m_mipLabel->setAlignment(Qt::AlignCenter);
    mipLayout->addWidget(m_mipLabel);
    viewLayout->addWidget(mipGroup, 1);
    mainLayout->addLayout(viewLayout, 2);

    m_infoLabel = new QLabel("No grid");
    mainLayout->addWidget(m_infoLabel);

    // Log area
    m_logEdit = new QTextEdit();
    m_logEdit->setReadOnly(true);
    m_logEdit->setMinimumHeight(120);
    mainLayout->addWidget(m_logEdit, 1);

    // Progress bar
    m_progressBar = new QProgressBar();
    m_progressBar->setRange(0, 100);
    m_progressBar->setValue(0);
    m_progressBar->setTextVisible(true);
    mainLayout->addWidget(m_progressBar);

    setCentralWidget(centralWidget);

    // Connect signals
    connect(m_browseInputBtn, &QPushButton::clicked, this, &MainWindow::browseInput);
    connect(m_voxelizeBtn, &QPushButton::clicked, this, &MainWindow::requestVoxelize);
    connect(m_voxelSizeSpin, &QDoubleSpinBox::editingFinished, this, &MainWindow::requestVoxelize);

    // View-only changes never re-voxelize
    connect(m_axisCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
        updateIndexRange();
        updateView();
    });
    connect(m_indexSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::updateView);
    connect(m_layerCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::updateView);
    connect(m_thresholdSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &MainWindow::updateView);
}

void MainWindow::browseInput() {
    QString filePath = QFileDialog::getOpenFileName(
        this,
        "Select Point File",
        QString(),
        "Points (*.csv *.txt *.ply);;All Files (*)");
    if (!filePath.isEmpty()) {
        m_inputPathEdit->setText(filePath);
    }
}

void MainWindow::requestVoxelize() {
    m_progressBar->setValue(0);
    onLogMessage(QString("Voxelizing (voxel size %1)...").arg(m_voxelSizeSpin->value()));

    emit voxelizeRequested(m_inputPathEdit->text(),
                           m_voxelSizeSpin->value(),
                           m_headerCheck->isChecked());
}

void MainWindow::setResult(std::shared_ptr<const voxgrid::VoxelizeResult> result) {
    m_result = std::move(result);
    m_query = std::make_unique<voxgrid::GridQuery>(m_result->grid);

    const voxgrid::VoxelGrid& grid = *m_result->grid;
    const auto& dims = grid.dims();
    onLogMessage(QString("Grid %1 x %2 x %3, %4 occupied cells, %5 out of bounds")
                     .arg(dims[0]).arg(dims[1]).arg(dims[2])
                     .arg(grid.occupied_cells())
                     .arg(m_result->out_of_bounds));
    if (m_result->out_of_bounds_fraction() > 0.05) {
        onLogMessage("Warning: more than 5% of points fell outside the bounds");
    }

    updateIndexRange();
    updateView();
}

void MainWindow::updateIndexRange() {
    if (!m_result) {
        return;
    }
    const auto& dims = m_result->grid->dims();
    int maxIndex = static_cast<int>(dims[m_axisCombo->currentIndex()]) - 1;
    m_indexSpin->setRange(0, maxIndex);
}

void MainWindow::updateView() {
    if (!m_query) {
        return;
    }

    const auto axis = static_cast<voxgrid::Axis>(m_axisCombo->currentIndex());
    const auto layer = m_layerCombo->currentIndex() == 1 ? voxgrid::GridLayer::Category
                                                         : voxgrid::GridLayer::Counts;
    const double threshold = m_thresholdSpin->value();

    try {
        voxgrid::Plane slice = m_query->slice(axis, static_cast<size_t>(m_indexSpin->value()), layer);
        voxgrid::Plane mip = m_query->max_intensity_projection(axis, layer);
        showImage(m_sliceLabel, renderPlane(slice, layer, threshold));
        showImage(m_mipLabel, renderPlane(mip, layer, threshold));

        size_t above = m_query->count_above(threshold, layer);
        m_infoLabel->setText(QString("Axis %1, index %2: max %3 | %4 cells above threshold")
                                 .arg(voxgrid::axis_name(axis))
                                 .arg(m_indexSpin->value())
                                 .arg(slice.max_value())
                                 .arg(above));
    } catch (const voxgrid::InvalidInputError& e) {
        m_sliceLabel->clear();
        m_mipLabel->clear();
        m_infoLabel->setText(QString::fromStdString(e.what()));
    } catch (const voxgrid::OutOfRangeError& e) {
        m_infoLabel->setText(QString::fromStdString(e.what()));
    }
}

QImage MainWindow::renderPlane(const voxgrid::Plane& plane, voxgrid::GridLayer layer,
                               double threshold) {
    QImage image(static_cast<int>(plane.rows), static_cast<int>(plane.cols), QImage::Format_RGB32);
    const double maxValue = plane.max_value();
    const double range = maxValue - threshold;

    for (size_t r = 0; r < plane.rows; ++r) {
        for (size_t c = 0; c < plane.cols; ++c) {
            const uint32_t v = plane.at(r, c);
            QRgb color = kEmptyColor;
            if (layer == voxgrid::GridLayer::Category) {
                auto category = voxgrid::category_from_rank(v);
                if (category) {
                    color = kCategoryColors[static_cast<size_t>(*category)];
                }
            } else if (v > threshold && range > 0.0) {
                int g = 40 + static_cast<int>(215.0 * (v - threshold) / range);
                color = qRgb(g, g, g);
            }
            image.setPixel(static_cast<int>(r), static_cast<int>(plane.cols - 1 - c), color);
        }
    }
    return image;
}

void MainWindow::showImage(QLabel* label, const QImage& image) {
    QPixmap pixmap = QPixmap::fromImage(image).scaled(
        label->size(), Qt::KeepAspectRatio, Qt::FastTransformation);
    label->setPixmap(pixmap);
}

void MainWindow::onProgressChanged(int percent) {
    m_progressBar->setValue(percent);
}

void MainWindow::onLogMessage(const QString& message) {
    QString timestamp = QTime::currentTime().toString("hh:mm:ss");
    m_logEdit->append(QString("[%1] %2").arg(timestamp, message));
}

void MainWindow::onVoxelizeFinished(bool success, const QString& error) {
    QString timestamp = QTime::currentTime().toString("hh:mm:ss");
    if (success) {
        m_progressBar->setValue(100);
    } else if (!error.isEmpty()) {
        m_logEdit->append(QString("[%1] <span style=\"color: red;\">Error: %2</span>").arg(timestamp, error));
    }
}
