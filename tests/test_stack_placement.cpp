#include <QtTest>
#include "TestFakes.hpp"
#include "core/popup/StackPlacement.hpp"

using creak::Edge;
using creak::NotificationRecord;

class TestStackPlacement : public QObject {
    Q_OBJECT
private slots:
    void testFirstPopupUsesDefaultOffset();
    void testOffsetsIncreaseByHeightAndGap();
    void testOtherEdgesDoNotStack();
    void testOrderIsCreationTimeThenId();
    void testCenterNeverStacks();
    void testTopRowGeometry();
    void testBottomRowGeometry();
    void testMiddleRowGeometry();
    void testScreenOrigin();
    void testAnchorsFollowEdge();
    void testAnchorMarginsMatchGeometry();
};

void TestStackPlacement::testFirstPopupUsesDefaultOffset()
{
    QCOMPARE(creak::stackOffset(Edge::Top, {}, 10, 20), 20);
    QCOMPARE(creak::stackOffset(Edge::BottomLeft, {}, 10, 0), 0);
}

void TestStackPlacement::testOffsetsIncreaseByHeightAndGap()
{
    QList<NotificationRecord> siblings;
    QList<int> offsets;
    for (int i = 0; i < 3; ++i) {
        auto record = makeRecord(Edge::Top, 100, 1000 + i, 1);
        record.id = static_cast<quint64>(i + 1);
        record.offset = creak::stackOffset(Edge::Top, siblings, 10, 20);
        offsets.append(record.offset);
        siblings.append(record);
    }
    QCOMPARE(offsets, (QList<int>{20, 130, 240}));
}

void TestStackPlacement::testOtherEdgesDoNotStack()
{
    QList<NotificationRecord> siblings = {
        makeRecord(Edge::TopLeft, 80, 1, 1),
        makeRecord(Edge::Bottom, 80, 2, 1),
        makeRecord(Edge::Top, 40, 3, 1),
    };
    QCOMPARE(creak::stackOffset(Edge::Top, siblings, 5, 20), 65);
    QCOMPARE(creak::stackOffset(Edge::TopRight, siblings, 5, 20), 20);
}

void TestStackPlacement::testOrderIsCreationTimeThenId()
{
    // The sum does not depend on order, but every sibling counts once.
    auto later = makeRecord(Edge::Right, 30, 200, 1);
    later.id = 1;
    auto earlier = makeRecord(Edge::Right, 70, 100, 1);
    earlier.id = 2;
    auto sameTime = makeRecord(Edge::Right, 50, 100, 1);
    sameTime.id = 3;

    QCOMPARE(creak::stackOffset(Edge::Right, {later, earlier, sameTime}, 10, 20),
             20 + 30 + 70 + 50 + 3 * 10);
}

void TestStackPlacement::testCenterNeverStacks()
{
    QList<NotificationRecord> siblings = {
        makeRecord(Edge::Center, 100, 1, 1),
        makeRecord(Edge::Center, 100, 2, 1),
    };
    QCOMPARE(creak::stackOffset(Edge::Center, siblings, 10, 20), 20);
}

void TestStackPlacement::testTopRowGeometry()
{
    const QRect screen(0, 0, 1920, 1080);
    const QSize size(350, 60);

    QCOMPARE(creak::popupGeometry(screen, Edge::TopLeft, size, 20, 130, 20),
             QRect(20, 130, 350, 60));
    QCOMPARE(creak::popupGeometry(screen, Edge::Top, size, 20, 20, 20),
             QRect((1920 - 350) / 2, 20, 350, 60));
    QCOMPARE(creak::popupGeometry(screen, Edge::TopRight, size, 20, 20, 20),
             QRect(1920 - 20 - 350, 20, 350, 60));
}

void TestStackPlacement::testBottomRowGeometry()
{
    const QRect screen(0, 0, 1920, 1080);
    const QSize size(350, 60);

    // Stacks grow upwards from the bottom edge.
    QCOMPARE(creak::popupGeometry(screen, Edge::Bottom, size, 20, 20, 20).y(), 1080 - 20 - 60);
    QCOMPARE(creak::popupGeometry(screen, Edge::BottomRight, size, 20, 90, 20),
             QRect(1920 - 20 - 350, 1080 - 90 - 60, 350, 60));
}

void TestStackPlacement::testMiddleRowGeometry()
{
    const QRect screen(0, 0, 1920, 1080);
    const QSize size(350, 60);

    QCOMPARE(creak::popupGeometry(screen, Edge::Center, size, 20, 20, 20),
             QRect((1920 - 350) / 2, (1080 - 60) / 2, 350, 60));
    QCOMPARE(creak::popupGeometry(screen, Edge::Left, size, 20, 20, 20),
             QRect(20, (1080 - 60) / 2, 350, 60));
    // Stacked side popups move down from the vertical center.
    QCOMPARE(creak::popupGeometry(screen, Edge::Right, size, 20, 90, 20).y(),
             (1080 - 60) / 2 + 70);
}

void TestStackPlacement::testScreenOrigin()
{
    const QRect screen(1920, 100, 1280, 1024);
    QCOMPARE(creak::popupGeometry(screen, Edge::TopLeft, QSize(200, 40), 10, 20, 20).topLeft(),
             QPoint(1930, 120));
}

void TestStackPlacement::testAnchorsFollowEdge()
{
    const QRect screen(0, 0, 1920, 1080);
    const QSize size(300, 50);
    const auto anchorsAt = [&](Edge edge) {
        return creak::edgeAnchors(screen, edge, creak::popupGeometry(screen, edge, size, 10, 20, 20));
    };

    const auto topLeft = anchorsAt(Edge::TopLeft);
    QVERIFY(topLeft.top && topLeft.left);
    QVERIFY(!topLeft.bottom && !topLeft.right);

    const auto top = anchorsAt(Edge::Top);
    QVERIFY(top.top);
    QVERIFY(!top.left && !top.right && !top.bottom);

    const auto right = anchorsAt(Edge::Right);
    QVERIFY(right.right && right.top);
    QVERIFY(!right.left && !right.bottom);

    const auto bottomRight = anchorsAt(Edge::BottomRight);
    QVERIFY(bottomRight.bottom && bottomRight.right);
    QVERIFY(!bottomRight.top && !bottomRight.left);

    const auto center = anchorsAt(Edge::Center);
    QVERIFY(!center.left && !center.right && !center.bottom);
}

void TestStackPlacement::testAnchorMarginsMatchGeometry()
{
    const QRect screen(1920, 100, 1280, 1024);
    const QSize size(200, 40);

    // Second popup in the stack: offset 20 + 40 + 10.
    const QRect topLeft = creak::popupGeometry(screen, Edge::TopLeft, size, 10, 70, 20);
    const auto a = creak::edgeAnchors(screen, Edge::TopLeft, topLeft);
    QCOMPARE(a.margins, QMargins(10, 70, 0, 0));

    const QRect bottomRight = creak::popupGeometry(screen, Edge::BottomRight, size, 10, 70, 20);
    const auto b = creak::edgeAnchors(screen, Edge::BottomRight, bottomRight);
    QCOMPARE(b.margins, QMargins(0, 0, 10, 70));

    // Middle row: vertically centered, shifted by the stack.
    const QRect left = creak::popupGeometry(screen, Edge::Left, size, 10, 70, 20);
    const auto c = creak::edgeAnchors(screen, Edge::Left, left);
    QCOMPARE(c.margins, QMargins(10, (1024 - 40) / 2 + 50, 0, 0));
}

QTEST_GUILESS_MAIN(TestStackPlacement)
#include "test_stack_placement.moc"
