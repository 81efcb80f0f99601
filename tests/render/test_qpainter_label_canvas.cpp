#include <gtest/gtest.h>
#include "render/QPainterLabelCanvas.hpp"
#include <QGuiApplication>
#include <QImage>
#include <QPainter>
#include <memory>

using namespace tdchart;

class QPainterLabelCanvasTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (!QGuiApplication::instance()) {
            static int argc = 1;
            static char arg0[] = "tdchart_tests";
            static char* argv[] = {arg0, nullptr};
            app_ = std::make_unique<QGuiApplication>(argc, argv);
        }
    }

    void SetUp() override {
        image_ = QImage(120, 60, QImage::Format_ARGB32_Premultiplied);
        image_.fill(Qt::transparent);
    }

    static std::unique_ptr<QGuiApplication> app_;
    QImage image_;
};

std::unique_ptr<QGuiApplication> QPainterLabelCanvasTest::app_;

TEST_F(QPainterLabelCanvasTest, SetFontAppliesPixelSizeAndWeight) {
    QPainter painter(&image_);
    QPainterLabelCanvas canvas(painter);

    canvas.setFont(13.4, true);
    EXPECT_EQ(painter.font().pixelSize(), 13);
    EXPECT_TRUE(painter.font().bold());

    canvas.setFont(0.2, false);
    EXPECT_EQ(painter.font().pixelSize(), 1);
    EXPECT_FALSE(painter.font().bold());
}

TEST_F(QPainterLabelCanvasTest, FillColorDrivesThePen) {
    QPainter painter(&image_);
    QPainterLabelCanvas canvas(painter);

    canvas.setFillColor(QColor("#facc15"));
    EXPECT_EQ(painter.pen().color(), QColor("#facc15"));
}

TEST_F(QPainterLabelCanvasTest, RestoreUndoesStateChanges) {
    QPainter painter(&image_);
    QPainterLabelCanvas canvas(painter);
    canvas.setFont(12, false);
    canvas.setFillColor(Qt::white);

    canvas.save();
    canvas.setFont(18, true);
    canvas.setFillColor(QColor("#f87171"));
    canvas.restore();

    EXPECT_EQ(painter.font().pixelSize(), 12);
    EXPECT_FALSE(painter.font().bold());
    EXPECT_EQ(painter.pen().color(), QColor(Qt::white));
}

TEST_F(QPainterLabelCanvasTest, FillTextStaysAroundTheAnchor) {
    {
        QPainter painter(&image_);
        QPainterLabelCanvas canvas(painter);
        canvas.setFont(16, true);
        canvas.setFillColor(Qt::white);
        canvas.fillText(QStringLiteral("9"), QPointF(60, 30));
    }

    // A single centered glyph never reaches the image border
    for (int y = 0; y < image_.height(); ++y) {
        EXPECT_EQ(qAlpha(image_.pixel(0, y)), 0);
        EXPECT_EQ(qAlpha(image_.pixel(image_.width() - 1, y)), 0);
    }
    for (int x = 0; x < image_.width(); ++x) {
        EXPECT_EQ(qAlpha(image_.pixel(x, 0)), 0);
        EXPECT_EQ(qAlpha(image_.pixel(x, image_.height() - 1)), 0);
    }
}
