#include <gtest/gtest.h>

#include "testutils.h"
#include "theme/gradient.h"

#include <QtNumeric>

TEST(GradientTest, ParsesStyleSheetGradient) {
    bool ok = false;
    QString error;
    const GradientDescriptor gradient = GradientDescriptor::fromString(
        "qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: 0 #F8F8F8, stop: 1 #EDEDED)", &ok, &error);

    ASSERT_TRUE(ok) << error.toStdString();
    EXPECT_EQ(gradient.start(), QPointF(0, 0));
    EXPECT_EQ(gradient.finalStop(), QPointF(0, 1));
    ASSERT_EQ(gradient.stops().size(), 2);
    EXPECT_EQ(gradient.firstColor(), QColor(0xF8, 0xF8, 0xF8));
    EXPECT_EQ(gradient.lastColor(), QColor(0xED, 0xED, 0xED));
    EXPECT_DOUBLE_EQ(gradient.stops().at(1).offset, 1.0);
}

TEST(GradientTest, WritesCanonicalText) {
    const GradientDescriptor gradient =
        GradientDescriptor::vertical(QColor(0xF8, 0xF8, 0xF8), QColor(0xED, 0xED, 0xED));

    EXPECT_EQ(gradient.toString(),
              QString("qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: 0 #F8F8F8, stop: 1 #EDEDED)"));
}

TEST(GradientTest, AcceptsSpreadAndFunctionColors) {
    bool ok = false;
    QString error;
    const GradientDescriptor gradient = GradientDescriptor::fromString(
        "qlineargradient(spread:pad, x1:0, y1:0, x2:1, y2:0, "
        "stop:0 rgba(255, 0, 0, 128), stop:0.5 #00FF00, stop:1 blue)", &ok, &error);

    ASSERT_TRUE(ok) << error.toStdString();
    ASSERT_EQ(gradient.stops().size(), 3);
    EXPECT_EQ(gradient.stops().at(0).color, QColor(255, 0, 0, 128));
    EXPECT_DOUBLE_EQ(gradient.stops().at(1).offset, 0.5);
    EXPECT_EQ(gradient.lastColor(), QColor(Qt::blue));
    EXPECT_EQ(gradient.finalStop(), QPointF(1, 0));
    EXPECT_TRUE(gradient.isValid());
}

TEST(GradientTest, RejectsMalformedText) {
    bool ok = true;
    QString error;

    GradientDescriptor::fromString("qlineargradient(x1: 0, z1: 1, stop: 0 red, stop: 1 blue)", &ok, &error);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(error.contains("unknown gradient argument")) << error.toStdString();

    ok = true;
    GradientDescriptor::fromString("qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: 0)", &ok, &error);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(error.contains("without a color")) << error.toStdString();

    ok = true;
    GradientDescriptor::fromString("qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: 0 nocolor)", &ok, &error);
    EXPECT_FALSE(ok);

    ok = true;
    GradientDescriptor::fromString("#FFFFFF", &ok, &error);
    EXPECT_FALSE(ok);
    EXPECT_FALSE(GradientDescriptor::isGradientFunction("#FFFFFF"));
    EXPECT_TRUE(GradientDescriptor::isGradientFunction("qlineargradient(x1: 0)"));
}

TEST(GradientTest, ValidationRejectsDecreasingOffsets) {
    const GradientDescriptor gradient = GradientDescriptor(QPointF(0, 0), QPointF(0, 1))
        .withStop(0.6, Qt::red)
        .withStop(0.4, Qt::blue);

    QString reason;
    EXPECT_FALSE(gradient.isValid(&reason));
    EXPECT_TRUE(reason.contains("smaller than the previous offset")) << reason.toStdString();
    EXPECT_FALSE(gradient.hasOrderedStops());
}

TEST(GradientTest, ValidationRejectsOffsetOutsideUnitRange) {
    const GradientDescriptor gradient = GradientDescriptor(QPointF(0, 0), QPointF(0, 1))
        .withStop(0.0, Qt::red)
        .withStop(1.5, Qt::blue);

    QString reason;
    EXPECT_FALSE(gradient.isValid(&reason));
    EXPECT_TRUE(reason.contains("outside [0, 1]")) << reason.toStdString();
    EXPECT_FALSE(gradient.hasOrderedStops());
}

TEST(GradientTest, ValidationRejectsNonFiniteValues) {
    const GradientDescriptor nanStop = GradientDescriptor(QPointF(0, 0), QPointF(0, 1))
        .withStop(qQNaN(), Qt::red)
        .withStop(1.0, Qt::blue);

    QString reason;
    EXPECT_FALSE(nanStop.isValid(&reason));
    EXPECT_TRUE(reason.contains("outside [0, 1]")) << reason.toStdString();
    EXPECT_FALSE(nanStop.hasOrderedStops());

    const GradientDescriptor infiniteAxis = GradientDescriptor(QPointF(0, 0), QPointF(0, qInf()))
        .withStop(0.0, Qt::red)
        .withStop(1.0, Qt::blue);
    EXPECT_FALSE(infiniteAxis.isValid(&reason));
    EXPECT_TRUE(reason.contains("non-finite")) << reason.toStdString();

    const GradientDescriptor nanAxis = GradientDescriptor(QPointF(qQNaN(), 0), QPointF(0, 1))
        .withStop(0.0, Qt::red)
        .withStop(1.0, Qt::blue);
    EXPECT_FALSE(nanAxis.isValid());
}

TEST(GradientTest, RejectsNonFiniteText) {
    bool ok = true;
    GradientDescriptor::fromString("qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: nan #FFF, stop: 1 #000)", &ok);
    EXPECT_FALSE(ok);

    ok = true;
    GradientDescriptor::fromString("qlineargradient(x1: 0, y1: 0, x2: 0, y2: inf, stop: 0 #FFF, stop: 1 #000)", &ok);
    EXPECT_FALSE(ok);
}

TEST(GradientTest, ValidationRejectsDegenerateGradients) {
    QString reason;
    const GradientDescriptor single = GradientDescriptor(QPointF(0, 0), QPointF(0, 1)).withStop(0.0, Qt::red);
    EXPECT_FALSE(single.isValid(&reason));
    EXPECT_TRUE(reason.contains("at least two stops"));

    const GradientDescriptor flat = GradientDescriptor(QPointF(0, 1), QPointF(0, 1))
        .withStop(0.0, Qt::red)
        .withStop(1.0, Qt::blue);
    EXPECT_FALSE(flat.isValid(&reason));
    EXPECT_TRUE(reason.contains("zero length"));
}

TEST(GradientTest, ReversedSwapsAxisAndKeepsStops) {
    const GradientDescriptor top = GradientDescriptor::vertical(Qt::white, Qt::gray);
    const GradientDescriptor bottom = top.reversed();

    EXPECT_EQ(bottom.start(), QPointF(0, 1));
    EXPECT_EQ(bottom.finalStop(), QPointF(0, 0));
    EXPECT_EQ(bottom.stops(), top.stops());
    EXPECT_NE(bottom, top);
    EXPECT_EQ(bottom.reversed(), top);
}

TEST(GradientTest, BuildsObjectBoundingBrushGradient) {
    const QLinearGradient linear = GradientDescriptor::vertical(Qt::white, Qt::black).toLinearGradient();

    EXPECT_EQ(linear.coordinateMode(), QGradient::ObjectBoundingMode);
    EXPECT_EQ(linear.start(), QPointF(0, 0));
    EXPECT_EQ(linear.finalStop(), QPointF(0, 1));
    ASSERT_EQ(linear.stops().size(), 2);
    EXPECT_EQ(linear.stops().at(0).second, QColor(Qt::white));
    EXPECT_EQ(linear.stops().at(1).second, QColor(Qt::black));
}
