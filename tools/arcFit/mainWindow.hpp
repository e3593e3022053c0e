#pragma once

#include "viewStep.hpp"

#include "arcfit/core/types.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>

class QComboBox;
class QLabel;

namespace arcfit {

class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};


class MainWindow : public QMainWindow {
public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setStatusText(const QString& text);

	void setViewStepChangedCallback(std::function<void(ViewStep)> callback);
	void setTacticChangedCallback(std::function<void(core::Tactic)> callback);

	ViewStep selectedViewStep() const;
	core::Tactic selectedTactic() const;
	void selectTactic(core::Tactic tactic);

private:
	void buildLayout();

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_viewCombo{nullptr};
	QComboBox* m_tacticCombo{nullptr};
	QLabel* m_statusLabel{nullptr};
	std::function<void(ViewStep)> m_viewChangedCallback{};
	std::function<void(core::Tactic)> m_tacticChangedCallback{};
};

} // namespace arcfit
