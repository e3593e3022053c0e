#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <utility>

namespace arcfit {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = matToQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);

	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	const QPoint topLeft((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
	painter.drawImage(topLeft, scaled);
}

//! Plots are always 8 bit BGR.
QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty() || mat.type() != CV_8UC3) {
		return {};
	}

	cv::Mat rgb;
	cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
	const QImage image(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
	return image.copy();
}

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Arc Fit");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setStatusText(const QString& text) {
	if (m_statusLabel != nullptr) {
		m_statusLabel->setText(text);
	}
}

void MainWindow::setViewStepChangedCallback(std::function<void(ViewStep)> callback) {
	m_viewChangedCallback = std::move(callback);
}

void MainWindow::setTacticChangedCallback(std::function<void(core::Tactic)> callback) {
	m_tacticChangedCallback = std::move(callback);
}

ViewStep MainWindow::selectedViewStep() const {
	return m_viewCombo->currentIndex() == 1 ? ViewStep::SearchLevels : ViewStep::Result;
}

core::Tactic MainWindow::selectedTactic() const {
	return m_tacticCombo->currentIndex() == 1 ? core::Tactic::Angle : core::Tactic::Radius;
}

void MainWindow::selectTactic(const core::Tactic tactic) {
	m_tacticCombo->setCurrentIndex(tactic == core::Tactic::Angle ? 1 : 0);
}

void MainWindow::buildLayout() {
	auto* rootWidget  = new QWidget(this);
	auto* rootLayout  = new QVBoxLayout(rootWidget);
	auto* controlRow  = new QHBoxLayout();
	auto* viewLabel   = new QLabel("View:", rootWidget);
	auto* tacticLabel = new QLabel("Tactic:", rootWidget);

	m_viewCombo = new QComboBox(rootWidget);
	m_viewCombo->addItem("Result");
	m_viewCombo->addItem("Search levels");
	m_viewCombo->setCurrentIndex(0);

	m_tacticCombo = new QComboBox(rootWidget);
	m_tacticCombo->addItem(core::toString(core::Tactic::Radius));
	m_tacticCombo->addItem(core::toString(core::Tactic::Angle));
	m_tacticCombo->setCurrentIndex(0);

	m_statusLabel = new QLabel(rootWidget);

	controlRow->addWidget(viewLabel);
	controlRow->addWidget(m_viewCombo);
	controlRow->addWidget(tacticLabel);
	controlRow->addWidget(m_tacticCombo);
	controlRow->addStretch(1);
	controlRow->addWidget(m_statusLabel);

	m_matrixView = new CvMatrixView(rootWidget);

	rootLayout->addLayout(controlRow);
	rootLayout->addWidget(m_matrixView, 1);

	setCentralWidget(rootWidget);

	connect(m_viewCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_viewChangedCallback) {
			m_viewChangedCallback(selectedViewStep());
		}
	});
	connect(m_tacticCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_tacticChangedCallback) {
			m_tacticChangedCallback(selectedTactic());
		}
	});
}

} // namespace arcfit
