#include <QtTest>
#include "ui/PopupWindow.hpp"

using creak::PopupStyle;
using creak::PopupWindow;

class TestPopupWindow : public QObject {
    Q_OBJECT
private slots:
    void testFontFromDescription();
    void testMeasureKeepsMinimumWidth();
    void testMeasureGrowsWithText();
    void testCreateAndDestroy();
    void testClickCallsDismissHandler();
};

void TestPopupWindow::testFontFromDescription()
{
    const QFont font = PopupWindow::fontFromDescription("DejaVu Sans Mono 13");
    QCOMPARE(font.family(), QString("DejaVu Sans Mono"));
    QCOMPARE(font.pointSizeF(), 13.0);

    const QFont familyOnly = PopupWindow::fontFromDescription("Serif");
    QCOMPARE(familyOnly.family(), QString("Serif"));

    const QFont sizeOnly = PopupWindow::fontFromDescription("20");
    QCOMPARE(sizeOnly.pointSizeF(), 20.0);
}

void TestPopupWindow::testMeasureKeepsMinimumWidth()
{
    PopupStyle style;
    PopupWindow window(style);
    const QSize size = window.measure("hi");
    QCOMPARE(size.width(), style.width);
    QVERIFY(size.height() > 2 * (style.padding + style.borderSize));
}

void TestPopupWindow::testMeasureGrowsWithText()
{
    PopupStyle style;
    PopupWindow window(style);
    const QSize one = window.measure("Title");
    const QSize two = window.measure("Title\nSecond line");
    QVERIFY(two.height() > one.height());

    // Long text wraps instead of widening.
    const QSize wrapped = window.measure(QString("word ").repeated(60));
    QCOMPARE(wrapped.width(), style.width);
    QVERIFY(wrapped.height() > two.height());
}

void TestPopupWindow::testCreateAndDestroy()
{
    PopupWindow window(PopupStyle{});
    const QRect geometry(QPoint(40, 20), window.measure("Hello"));
    QVERIFY2(window.createSurface(geometry, creak::Edge::TopLeft, "Hello"), qPrintable(window.errorString()));
    QVERIFY(window.isVisible());
    QVERIFY(window.handle());

    window.destroySurface();
    QVERIFY(!window.isVisible());
    QVERIFY(!window.handle());
}

void TestPopupWindow::testClickCallsDismissHandler()
{
    PopupWindow window(PopupStyle{});
    int dismissed = 0;
    window.setDismissHandler([&dismissed]() { ++dismissed; });
    QVERIFY(window.createSurface(QRect(0, 0, 200, 60), creak::Edge::TopLeft, "Click me"));
    QVERIFY(QTest::qWaitForWindowExposed(&window));

    QTest::mouseClick(&window, Qt::LeftButton, Qt::NoModifier, QPoint(100, 30));
    QTRY_COMPARE(dismissed, 1);
}

QTEST_MAIN(TestPopupWindow)
#include "test_popup_window.moc"
